/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "ConfigurationImpl.hpp"
#include "Configuration.hpp"

#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"

namespace neurolab {


ConfigurationImpl::ConfigurationImpl() :
	m_logging(false),
	m_tau(10.0),
	m_vRest(-65.0),
	m_initialPotential(-70.0),
	m_stepSize(0.1),
	m_tStart(0.0),
	m_tEnd(100.0),
	m_inputGain(10.0),
	m_tieTolerance(0.0),
	m_hysteresisThreshold(0.75),
	m_streamingThreshold(0.5),
	m_normalizationFactor(0.05),
	m_recallSteps(50),
	m_signPolicy(NEUROLAB_SIGN_KEEP),
	m_seed(0)
{
	;
}



void
checkFinite(double val, const char* name)
{
	using boost::format;
	if(!boost::math::isfinite(val)) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Configuration parameter %s must be finite") % name));
	}
}



void
ConfigurationImpl::setMembrane(double tau, double vRest)
{
	using boost::format;
	checkFinite(tau, "tau");
	checkFinite(vRest, "v-rest");
	if(tau <= 0.0) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Membrane time constant must be positive (got %g)") % tau));
	}
	m_tau = tau;
	m_vRest = vRest;
}



void
ConfigurationImpl::setInitialPotential(double v)
{
	checkFinite(v, "initial-potential");
	m_initialPotential = v;
}



void
ConfigurationImpl::setStepSize(double dt)
{
	using boost::format;
	if(!(dt > 0.0) || !boost::math::isfinite(dt)) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				str(format("Step size must be positive (got %g)") % dt));
	}
	m_stepSize = dt;
}



void
ConfigurationImpl::setSimulationTime(double tStart, double tEnd)
{
	using boost::format;
	if(!boost::math::isfinite(tStart) || !boost::math::isfinite(tEnd)) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				"Simulation start and end time must be finite");
	}
	if(tEnd < tStart) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				str(format("End time %g precedes start time %g") % tEnd % tStart));
	}
	m_tStart = tStart;
	m_tEnd = tEnd;
}



void
ConfigurationImpl::setInputGain(double gain)
{
	checkFinite(gain, "input-gain");
	m_inputGain = gain;
}



void
ConfigurationImpl::setTieTolerance(double tolerance)
{
	using boost::format;
	checkFinite(tolerance, "tie-tolerance");
	if(tolerance < 0.0) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Tie tolerance must be non-negative (got %g)") % tolerance));
	}
	m_tieTolerance = tolerance;
}



void
ConfigurationImpl::setHysteresisThreshold(double threshold)
{
	checkFinite(threshold, "threshold");
	m_hysteresisThreshold = threshold;
}



void
ConfigurationImpl::setStreamingThreshold(double threshold)
{
	checkFinite(threshold, "streaming-threshold");
	m_streamingThreshold = threshold;
}



void
ConfigurationImpl::setNormalizationFactor(double factor)
{
	checkFinite(factor, "normalization-factor");
	m_normalizationFactor = factor;
}



unsigned
ConfigurationImpl::noiseFlipCount() const
{
	if(!m_noiseFlipCount) {
		throw neurolab::exception(NEUROLAB_LOGIC_ERROR,
				"Noise flip count requested, but not set");
	}
	return *m_noiseFlipCount;
}




const char*
signPolicyName(sign_policy_t policy)
{
	switch(policy) {
		case NEUROLAB_SIGN_KEEP : return "keep";
		case NEUROLAB_SIGN_POSITIVE : return "positive";
		case NEUROLAB_SIGN_REJECT : return "reject";
		default : return "unknown";
	}
}



sign_policy_t
parseSignPolicy(const std::string& name)
{
	using boost::format;
	if(name == "keep") {
		return NEUROLAB_SIGN_KEEP;
	} else if(name == "positive") {
		return NEUROLAB_SIGN_POSITIVE;
	} else if(name == "reject") {
		return NEUROLAB_SIGN_REJECT;
	}
	throw neurolab::exception(NEUROLAB_INVALID_INPUT,
			str(format("Unknown sign policy '%s' (expected keep, positive or reject)") % name));
}

} // end namespace neurolab



std::ostream& operator<<(std::ostream& o, neurolab::ConfigurationImpl const& conf)
{
	using boost::format;
	o << format("membrane: tau=%g v_rest=%g v0=%g")
			% conf.tau() % conf.restingPotential() % conf.initialPotential()
	  << format(", integration: dt=%g t=[%g, %g] gain=%g")
			% conf.stepSize() % conf.startTime() % conf.endTime() % conf.inputGain()
	  << format(", thresholds: %g/%g tie-tolerance=%g")
			% conf.hysteresisThreshold() % conf.streamingThreshold() % conf.tieTolerance()
	  << format(", hopfield: normalization=%g steps=%u sign=%s")
			% conf.normalizationFactor() % conf.recallSteps() % neurolab::signPolicyName(conf.signPolicy());
	if(conf.noiseFlipCountSet()) {
		o << " flips=" << conf.noiseFlipCount();
	}
	return o << " seed=" << conf.seed();
}
