#ifndef NEUROLAB_ERRORS_H
#define NEUROLAB_ERRORS_H

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

/*! \file errors.h
 *
 * Error numbers carried by \a neurolab::exception */

/*! The call resulted in no errors */
#define NEUROLAB_OK 0

/*! Some input argument violates the contract of the call */
#define NEUROLAB_INVALID_INPUT 1

/*! The integration step size or time interval is invalid (step size not
 * positive, end time before start time, or non-finite values) */
#define NEUROLAB_INVALID_STEP_CONFIG 2

/*! Stimulus selection was attempted on an empty stimulus vector */
#define NEUROLAB_EMPTY_STIMULUS_SET 3

/*! Pattern lengths differ from each other or from the weight matrix */
#define NEUROLAB_LENGTH_MISMATCH 4

/*! A neuron activation was exactly zero and the sign policy does not allow
 * resolving it */
#define NEUROLAB_DEGENERATE_SIGN_STATE 5

/*! Internal error; should not happen */
#define NEUROLAB_LOGIC_ERROR 6

#endif
