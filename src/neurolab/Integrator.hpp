#ifndef NEUROLAB_INTEGRATOR_HPP
#define NEUROLAB_INTEGRATOR_HPP

//! \file Integrator.hpp

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

namespace neurolab {


/*! \brief Right-hand side of a scalar first-order ODE
 *
 * dV/dt = g(V, t, I) where \a I is an external input held constant over a
 * single step. */
class NEUROLAB_DLL_PUBLIC Derivative
{
	public :

		virtual ~Derivative() {}

		virtual double operator()(double v, double t, double input) const = 0;

		/*! \return heap-allocated copy, owned by the caller */
		virtual Derivative* clone() const = 0;
};



/*! \brief Leaky integrator membrane
 *
 * dV/dt = (-(V - V_rest) + I) / tau
 */
class NEUROLAB_DLL_PUBLIC MembranePotential : public Derivative
{
	public :

		/*! \throws neurolab::exception if \a tau is not positive */
		MembranePotential(double tau, double vRest);

		double operator()(double v, double t, double input) const {
			return (-(v - m_vRest) + input) / m_tau;
		}

		Derivative* clone() const { return new MembranePotential(*this); }

		double tau() const { return m_tau; }
		double restingPotential() const { return m_vRest; }

	private :

		double m_tau;
		double m_vRest;
};



/*! Time points and values of an integration run. The two vectors are index
 * aligned and the first entry is the initial condition. */
struct NEUROLAB_DLL_PUBLIC Trajectory
{
	std::vector<double> times;
	std::vector<double> values;

	size_t size() const { return values.size(); }
};



/*! \return number of steps of size \a dt which fit in [tStart, tEnd]
 *
 * \throws neurolab::exception (NEUROLAB_INVALID_STEP_CONFIG) if \a dt is
 * 		not positive, \a tEnd < \a tStart, or any argument is not finite.
 */
NEUROLAB_DLL_PUBLIC
unsigned
stepCount(double tStart, double tEnd, double dt);


/*! Single explicit (forward Euler) step
 *
 * \return v + dt * g(v, t, input)
 */
inline
double
eulerStep(const Derivative& g, double v, double t, double dt, double input)
{
	return v + dt * g(v, t, input);
}


/*! Integrate g from \a v0 over [tStart, tEnd] with fixed step size \a dt
 * and constant external input.
 *
 * The number of steps is floor((tEnd - tStart) / dt). The returned
 * trajectory has one more entry than there are steps.
 *
 * \throws neurolab::exception (NEUROLAB_INVALID_STEP_CONFIG) as \a stepCount
 */
NEUROLAB_DLL_PUBLIC
Trajectory
integrate(const Derivative& g,
		double v0,
		double tStart,
		double tEnd,
		double dt,
		double input);

} // end namespace neurolab

#endif
