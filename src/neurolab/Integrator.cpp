/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Integrator.hpp"

#include <cmath>
#include <limits>
#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"
#include "log.hpp"

namespace neurolab {


MembranePotential::MembranePotential(double tau, double vRest) :
	m_tau(tau),
	m_vRest(vRest)
{
	using boost::format;
	if(!(tau > 0.0) || !boost::math::isfinite(tau)) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Membrane time constant must be positive (got %g)") % tau));
	}
}



unsigned
stepCount(double tStart, double tEnd, double dt)
{
	using boost::format;

	if(!boost::math::isfinite(tStart) || !boost::math::isfinite(tEnd)
			|| !boost::math::isfinite(dt)) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				"Integration bounds and step size must be finite");
	}

	if(dt <= 0.0) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				str(format("Step size must be positive (got %g)") % dt));
	}

	if(tEnd < tStart) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				str(format("End time %g precedes start time %g") % tEnd % tStart));
	}

	double n = std::floor((tEnd - tStart) / dt);
	if(n >= double(std::numeric_limits<unsigned>::max())) {
		throw neurolab::exception(NEUROLAB_INVALID_STEP_CONFIG,
				str(format("Too many integration steps (%g)") % n));
	}
	return unsigned(n);
}



Trajectory
integrate(const Derivative& g,
		double v0,
		double tStart,
		double tEnd,
		double dt,
		double input)
{
	unsigned steps = stepCount(tStart, tEnd, dt);

	LOG("integrate: %u steps of %g from t=%g, v0=%g, I=%g\n",
			steps, dt, tStart, v0, input);

	Trajectory tr;
	tr.times.reserve(steps+1);
	tr.values.reserve(steps+1);

	double v = v0;
	double t = tStart;
	tr.times.push_back(t);
	tr.values.push_back(v);

	for(unsigned k=0; k < steps; ++k) {
		v = eulerStep(g, v, t, dt, input);
		t = t + dt;
		tr.times.push_back(t);
		tr.values.push_back(v);
	}

	return tr;
}

} // end namespace neurolab
