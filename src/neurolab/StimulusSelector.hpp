#ifndef NEUROLAB_STIMULUS_SELECTOR_HPP
#define NEUROLAB_STIMULUS_SELECTOR_HPP

//! \file StimulusSelector.hpp

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
#include <neurolab/Selection.hpp>

namespace neurolab {

class NotificationSink;


/*! \brief Winner selection over a stimulus vector
 *
 * The stimulus vector contains non-negative intensities, with index 0 being
 * the leftmost position in the visual field. The selector finds the entries
 * attaining the maximum intensity and resolves ties according to its policy.
 *
 * By default ties are detected by exact equality of the stored values. A
 * non-zero tolerance makes every value within \a tolerance of the maximum
 * count as tied.
 */
class NEUROLAB_DLL_PUBLIC StimulusSelector
{
	public :

		/*! \throws neurolab::exception if \a tolerance is negative or not finite */
		explicit StimulusSelector(
				tie_policy_t policy = NEUROLAB_ALLOW_TIES,
				double tolerance = 0.0);

		/*! Select the strongest stimulus
		 *
		 * \param stimuli intensities, left to right
		 * \param sink optional receiver of the selection event
		 *
		 * \return single index if the maximum is unique. Otherwise all tied
		 * 		indices (NEUROLAB_ALLOW_TIES) or no selection
		 * 		(NEUROLAB_REJECT_TIES).
		 *
		 * \throws neurolab::exception (NEUROLAB_EMPTY_STIMULUS_SET) if \a
		 * 		stimuli is empty
		 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if any intensity
		 * 		is negative or not finite
		 */
		Selection select(const std::vector<double>& stimuli,
				NotificationSink* sink = NULL) const;

		tie_policy_t policy() const { return m_policy; }

		double tolerance() const { return m_tolerance; }

	private :

		tie_policy_t m_policy;

		double m_tolerance;
};


/*! \return the largest intensity in \a stimuli
 *
 * \throws neurolab::exception (NEUROLAB_EMPTY_STIMULUS_SET) if \a stimuli is
 * 		empty
 */
NEUROLAB_DLL_PUBLIC
double
maxStimulus(const std::vector<double>& stimuli);

} // end namespace neurolab

#endif
