#ifndef NEUROLAB_MOTOR_ENCODER_HPP
#define NEUROLAB_MOTOR_ENCODER_HPP

//! \file MotorEncoder.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <vector>

#include <neurolab/config.h>
#include <neurolab/types.h>

namespace neurolab {

class Selection;

/*! \name Motor encoding
 *
 * Map a position in a visual field of \a n stimuli onto a signed strike
 * direction in [-(n-1)/2, (n-1)/2]. Negative values are to the left, zero is
 * straight ahead.
 *
 * All functions throw neurolab::exception (NEUROLAB_INVALID_INPUT) if \a n
 * is zero or an index lies outside the field.
 */
/* \{ */

/*! \return idx - (n-1)/2 */
NEUROLAB_DLL_PUBLIC
double
direction(nidx_t idx, size_t n);


/*! \return the mean of the directions of all \a indices
 * \throws neurolab::exception if \a indices is empty */
NEUROLAB_DLL_PUBLIC
double
direction(const std::vector<nidx_t>& indices, size_t n);


/*! \return direction of a single or tied selection
 *
 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if \a sel is empty.
 * 		Callers should check for an empty selection and skip motor output.
 */
NEUROLAB_DLL_PUBLIC
double
direction(const Selection& sel, size_t n);

/* \} */

} // end namespace neurolab

#endif
