#ifndef NEUROLAB_CONFIGURATION_IMPL_HPP
#define NEUROLAB_CONFIGURATION_IMPL_HPP

//! \file ConfigurationImpl.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ostream>
#include <boost/optional.hpp>

#include <neurolab/config.h>
#include <neurolab/types.h>

namespace neurolab {

class NEUROLAB_DLL_PUBLIC ConfigurationImpl
{
	public:

		ConfigurationImpl();

		/*! Switch on event reporting */
		void enableLogging() { m_logging = true; }

		void disableLogging() { m_logging = false; }
		bool loggingEnabled() const { return m_logging; }

		/* Membrane model */

		void setMembrane(double tau, double vRest);
		double tau() const { return m_tau; }
		double restingPotential() const { return m_vRest; }

		void setInitialPotential(double v);
		double initialPotential() const { return m_initialPotential; }

		/* Integration */

		void setStepSize(double dt);
		double stepSize() const { return m_stepSize; }

		void setSimulationTime(double tStart, double tEnd);
		double startTime() const { return m_tStart; }
		double endTime() const { return m_tEnd; }

		void setInputGain(double gain);
		double inputGain() const { return m_inputGain; }

		/* Selection and hysteresis */

		void setTieTolerance(double tolerance);
		double tieTolerance() const { return m_tieTolerance; }

		void setHysteresisThreshold(double threshold);
		double hysteresisThreshold() const { return m_hysteresisThreshold; }

		void setStreamingThreshold(double threshold);
		double streamingThreshold() const { return m_streamingThreshold; }

		/* Hopfield memory */

		void setNormalizationFactor(double factor);
		double normalizationFactor() const { return m_normalizationFactor; }

		void setRecallSteps(unsigned steps) { m_recallSteps = steps; }
		unsigned recallSteps() const { return m_recallSteps; }

		void setNoiseFlipCount(unsigned flips) { m_noiseFlipCount = flips; }
		bool noiseFlipCountSet() const { return m_noiseFlipCount.is_initialized(); }

		/*! \return the number of noise flips. If the user has not specified
		 * this (\see noiseFlipCountSet) an exception is thrown */
		unsigned noiseFlipCount() const;

		void setSignPolicy(sign_policy_t policy) { m_signPolicy = policy; }
		sign_policy_t signPolicy() const { return m_signPolicy; }

		void setSeed(unsigned seed) { m_seed = seed; }
		unsigned seed() const { return m_seed; }

	private:

		bool m_logging;

		double m_tau;
		double m_vRest;
		double m_initialPotential;

		double m_stepSize;
		double m_tStart;
		double m_tEnd;
		double m_inputGain;

		double m_tieTolerance;
		double m_hysteresisThreshold;
		double m_streamingThreshold;

		double m_normalizationFactor;
		unsigned m_recallSteps;
		boost::optional<unsigned> m_noiseFlipCount;
		sign_policy_t m_signPolicy;
		unsigned m_seed;
};

}


NEUROLAB_DLL_PUBLIC
std::ostream& operator<<(std::ostream& o, neurolab::ConfigurationImpl const& conf);

#endif
