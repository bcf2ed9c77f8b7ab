/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "StimulusSelector.hpp"

#include <algorithm>
#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "Notification.hpp"
#include "exception.hpp"
#include "log.hpp"

namespace neurolab {


StimulusSelector::StimulusSelector(tie_policy_t policy, double tolerance) :
	m_policy(policy),
	m_tolerance(tolerance)
{
	using boost::format;
	if(!(tolerance >= 0.0) || !boost::math::isfinite(tolerance)) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Tie tolerance must be non-negative (got %g)") % tolerance));
	}
}



double
maxStimulus(const std::vector<double>& stimuli)
{
	if(stimuli.empty()) {
		throw neurolab::exception(NEUROLAB_EMPTY_STIMULUS_SET,
				"Cannot select from an empty stimulus set");
	}
	return *std::max_element(stimuli.begin(), stimuli.end());
}



void
checkIntensities(const std::vector<double>& stimuli)
{
	using boost::format;
	for(size_t i=0; i < stimuli.size(); ++i) {
		if(!(stimuli[i] >= 0.0) || !boost::math::isfinite(stimuli[i])) {
			throw neurolab::exception(NEUROLAB_INVALID_INPUT,
					str(format("Invalid intensity %g for stimulus %u") % stimuli[i] % i));
		}
	}
}



Selection
StimulusSelector::select(const std::vector<double>& stimuli,
		NotificationSink* sink) const
{
	const double max = maxStimulus(stimuli);
	checkIntensities(stimuli);

	std::vector<nidx_t> winners;
	for(nidx_t i=0; i < stimuli.size(); ++i) {
		bool tied = m_tolerance == 0.0
			? stimuli[i] == max
			: max - stimuli[i] <= m_tolerance;
		if(tied) {
			winners.push_back(i);
		}
	}

	Selection sel;
	if(winners.size() == 1) {
		sel = Selection::single(winners.front());
	} else if(m_policy == NEUROLAB_ALLOW_TIES) {
		sel = Selection::tied(winners);
	} else {
		LOG("select: %u stimuli tied at %g, no winner\n", unsigned(winners.size()), max);
		sel = Selection::none();
	}

	if(sink != NULL) {
		sink->selection(sel);
	}
	return sel;
}

} // end namespace neurolab
