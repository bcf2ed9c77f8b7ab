#ifndef NEUROLAB_CONFIGURATION_HPP
#define NEUROLAB_CONFIGURATION_HPP

//! \file Configuration.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ostream>
#include <string>

#include <neurolab/config.h>
#include <neurolab/types.h>


namespace neurolab {
	class Configuration;
}


NEUROLAB_DLL_PUBLIC
std::ostream& operator<<(std::ostream& o, neurolab::Configuration const& conf);


namespace neurolab {

class ConfigurationImpl;

/*! \brief Parameters of the leaky-integrator and Hopfield models
 *
 * A default-constructed configuration reproduces the reference scenarios:
 * tau=10, v_rest=-65, v0=-70, dt=0.1 over [0, 100], input gain 10,
 * hysteresis thresholds 0.75 (one-shot) and 0.5 (streaming), exact tie
 * detection, normalization factor 0.05 and 50 recall sweeps.
 *
 * Setters validate their arguments and throw neurolab::exception on invalid
 * values, leaving the configuration unchanged.
 */
class NEUROLAB_DLL_PUBLIC Configuration
{
	public:

		Configuration();

		Configuration(const Configuration&);

		~Configuration();

		/*! Exchange all settings with \a other */
		void swap(Configuration& other);

		/*! Switch on reporting of selection and hysteresis events */
		void enableLogging();

		void disableLogging();
		bool loggingEnabled() const;

		/*! Set the membrane time constant and resting potential
		 *
		 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if \a tau is
		 * 		not positive */
		void setMembrane(double tau, double vRest);
		double tau() const;
		double restingPotential() const;

		void setInitialPotential(double v);
		double initialPotential() const;

		/*! \throws neurolab::exception (NEUROLAB_INVALID_STEP_CONFIG) if \a dt
		 * 		is not positive */
		void setStepSize(double dt);
		double stepSize() const;

		/*! \throws neurolab::exception (NEUROLAB_INVALID_STEP_CONFIG) if
		 * 		\a tEnd < \a tStart */
		void setSimulationTime(double tStart, double tEnd);
		double startTime() const;
		double endTime() const;

		/*! Set the factor converting stimulus intensity to input current */
		void setInputGain(double gain);
		double inputGain() const;

		/*! Values within \a tolerance of the maximum count as tied. The
		 * default of zero gives exact comparison. */
		void setTieTolerance(double tolerance);
		double tieTolerance() const;

		/*! Threshold for the one-shot hysteresis check on stimulus intensity */
		void setHysteresisThreshold(double threshold);
		double hysteresisThreshold() const;

		/*! Threshold for the per-step hysteresis gate on input current */
		void setStreamingThreshold(double threshold);
		double streamingThreshold() const;

		void setNormalizationFactor(double factor);
		double normalizationFactor() const;

		/*! Set the maximum number of asynchronous sweeps per recall */
		void setRecallSteps(unsigned steps);
		unsigned recallSteps() const;

		/*! Set the number of entries flipped when corrupting a pattern. If
		 * unset, the caller chooses. */
		void setNoiseFlipCount(unsigned flips);
		bool noiseFlipCountSet() const;

		/*! \throws neurolab::exception if the flip count is not set */
		unsigned noiseFlipCount() const;

		void setSignPolicy(sign_policy_t policy);
		sign_policy_t signPolicy() const;

		/*! Seed for the noise generator */
		void setSeed(unsigned seed);
		unsigned seed() const;

	private:

		friend std::ostream& ::operator<<(std::ostream& o, Configuration const&);

		ConfigurationImpl* m_impl;

		// undefined
		Configuration& operator=(const Configuration&);
};


/*! Read parameters from an .ini-style configuration file
 *
 * Recognised keys are tau, v-rest, initial-potential, step-size, t-start,
 * t-end, input-gain, tie-tolerance, threshold, streaming-threshold,
 * normalization-factor, recall-steps, noise-flip-count, sign-policy (keep,
 * positive or reject), seed and logging. Keys missing from the file leave
 * the corresponding parameter of \a conf unchanged.
 *
 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if the file cannot be
 * 		read, contains unknown keys or malformed values. Values rejected by
 * 		the setters raise the setter's error. In either case \a conf is
 * 		left as it was.
 */
NEUROLAB_DLL_PUBLIC
void
loadConfigurationFile(const std::string& filename, Configuration& conf);


/*! \return short name of a sign policy, as used in configuration files */
NEUROLAB_DLL_PUBLIC
const char*
signPolicyName(sign_policy_t);


/*! \throws neurolab::exception (NEUROLAB_INVALID_INPUT) for unknown names */
NEUROLAB_DLL_PUBLIC
sign_policy_t
parseSignPolicy(const std::string& name);

} // end namespace neurolab


#endif
