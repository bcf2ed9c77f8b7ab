#ifndef NEUROLAB_TYPES_H
#define NEUROLAB_TYPES_H

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

typedef unsigned nidx_t;  // neuron or stimulus index
typedef int bipolar_t;    // single entry of a bipolar pattern, -1 or +1


/*! How to resolve several stimuli sharing the maximum intensity */
typedef enum {
	NEUROLAB_ALLOW_TIES,  // report all tied indices
	NEUROLAB_REJECT_TIES  // report no winner
} tie_policy_t;


/*! How to resolve an exactly-zero activation during Hopfield recall */
typedef enum {
	NEUROLAB_SIGN_KEEP,     // neuron keeps its previous value
	NEUROLAB_SIGN_POSITIVE, // neuron is set to +1
	NEUROLAB_SIGN_REJECT    // recall fails with NEUROLAB_DEGENERATE_SIGN_STATE
} sign_policy_t;

#endif
