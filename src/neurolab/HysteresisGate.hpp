#ifndef NEUROLAB_HYSTERESIS_GATE_HPP
#define NEUROLAB_HYSTERESIS_GATE_HPP

//! \file HysteresisGate.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <utility>
#include <vector>
#include <boost/scoped_ptr.hpp>

#include <neurolab/config.h>
#include <neurolab/Integrator.hpp>

namespace neurolab {

class NotificationSink;


/*! Single gated integration step
 *
 * If \a input strictly exceeds \a threshold the state is advanced by one
 * Euler step and the new value also becomes the retained value. Otherwise
 * the state is replaced by \a retained, which is left unchanged.
 *
 * \return (new value, new retained value)
 */
NEUROLAB_DLL_PUBLIC
std::pair<double, double>
hysteresisStep(const Derivative& g,
		double dt,
		double v,
		double t,
		double input,
		double threshold,
		double retained);


/*! One-shot hysteresis check on a stimulus vector
 *
 * \return the maximum stimulus if it strictly exceeds \a threshold,
 * 		otherwise \a previous
 *
 * \param sink optional receiver of the decision, reported at time zero
 *
 * \throws neurolab::exception (NEUROLAB_EMPTY_STIMULUS_SET) if \a stimuli is
 * 		empty
 */
NEUROLAB_DLL_PUBLIC
double
hysteresis(const std::vector<double>& stimuli, double previous, double threshold,
		NotificationSink* sink = NULL);



/*! \brief Integrator gate which holds its state on sub-threshold input
 *
 * The gate owns the retained value and a copy of the derivative.
 */
class NEUROLAB_DLL_PUBLIC HysteresisGate
{
	public :

		/*! The gate keeps its own copy of \a g
		 *
		 * \throws neurolab::exception (NEUROLAB_INVALID_STEP_CONFIG) if \a dt
		 * 		is not positive */
		HysteresisGate(const Derivative& g, double dt, double threshold, double retained);

		/*! Advance the state \a v at time \a t with the given input
		 *
		 * \return the new state
		 */
		double step(double v, double t, double input, NotificationSink* sink = NULL);

		double retained() const { return m_retained; }

		double threshold() const { return m_threshold; }

		double stepSize() const { return m_dt; }

	private :

		boost::scoped_ptr<const Derivative> m_g;

		double m_dt;
		double m_threshold;
		double m_retained;
};



/*! Integrate with a hysteresis gate and a time-indexed stimulus sequence
 *
 * At step \a k the external input is \a gain * stimuli[k], or zero once the
 * stimulus sequence is exhausted. The gate is evaluated at every step. The
 * initial retained value is \a retained.
 *
 * \return trajectory of the same shape as \a integrate
 *
 * \throws neurolab::exception (NEUROLAB_INVALID_STEP_CONFIG) as \a stepCount
 */
NEUROLAB_DLL_PUBLIC
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
		NotificationSink* sink = NULL);

} // end namespace neurolab

#endif
