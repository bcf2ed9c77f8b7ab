/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "HysteresisGate.hpp"

#include <boost/format.hpp>

#include "Notification.hpp"
#include "StimulusSelector.hpp"
#include "exception.hpp"
#include "log.hpp"

namespace neurolab {


std::pair<double, double>
hysteresisStep(const Derivative& g,
		double dt,
		double v,
		double t,
		double input,
		double threshold,
		double retained)
{
	if(input > threshold) {
		double next = eulerStep(g, v, t, dt, input);
		return std::make_pair(next, next);
	}
	return std::make_pair(retained, retained);
}



double
hysteresis(const std::vector<double>& stimuli, double previous, double threshold,
		NotificationSink* sink)
{
	double max = maxStimulus(stimuli);
	bool driven = max > threshold;
	double response = driven ? max : previous;

	if(sink != NULL) {
		sink->hysteresis(HysteresisDecision(
					driven ? HysteresisDecision::DRIVEN : HysteresisDecision::HELD,
					0.0, response));
	}
	return response;
}



HysteresisGate::HysteresisGate(const Derivative& g,
		double dt, double threshold, double retained) :
	m_g(g.clone()),
	m_dt(dt),
	m_threshold(threshold),
	m_retained(retained)
{
	using boost::format;
	if(!(dt > 0.0)) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				str(format("Step size must be positive (got %g)") % dt));
	}
}



double
HysteresisGate::step(double v, double t, double input, NotificationSink* sink)
{
	bool driven = input > m_threshold;
	std::pair<double, double> r =
		hysteresisStep(*m_g, m_dt, v, t, input, m_threshold, m_retained);
	m_retained = r.second;

	if(sink != NULL) {
		sink->hysteresis(HysteresisDecision(
					driven ? HysteresisDecision::DRIVEN : HysteresisDecision::HELD,
					t, r.first));
	}
	return r.first;
}



Trajectory
integrateWithHysteresis(const Derivative& g,
		double v0,
		double tStart,
		double tEnd,
		double dt,
		const std::vector<double>& stimuli,
		double gain,
		double threshold,
		double retained,
		NotificationSink* sink)
{
	unsigned steps = stepCount(tStart, tEnd, dt);

	LOG("integrateWithHysteresis: %u steps, %u stimuli, threshold %g\n",
			steps, unsigned(stimuli.size()), threshold);

	HysteresisGate gate(g, dt, threshold, retained);

	Trajectory tr;
	tr.times.reserve(steps+1);
	tr.values.reserve(steps+1);

	double v = v0;
	double t = tStart;
	tr.times.push_back(t);
	tr.values.push_back(v);

	for(unsigned k=0; k < steps; ++k) {
		double input = k < stimuli.size() ? stimuli[k] * gain : 0.0;
		v = gate.step(v, t, input, sink);
		t = t + dt;
		tr.times.push_back(t);
		tr.values.push_back(v);
	}

	return tr;
}

} // end namespace neurolab
