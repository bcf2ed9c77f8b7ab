#ifndef NEUROLAB_NOTIFICATION_HPP
#define NEUROLAB_NOTIFICATION_HPP

//! \file Notification.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <neurolab/config.h>
#include <neurolab/Selection.hpp>

namespace neurolab {


/*! Outcome of a single hysteresis gate step */
struct NEUROLAB_DLL_PUBLIC HysteresisDecision
{
	enum mode_t {
		DRIVEN, // input crossed the threshold and the state was integrated
		HELD    // input did not cross the threshold, retained state was used
	};

	HysteresisDecision(mode_t mode, double time, double value) :
		mode(mode), time(time), value(value) { }

	mode_t mode;

	/*! Simulation time at the start of the step */
	double time;

	/*! State value after the step */
	double value;
};



/*! \brief Receiver of structured events produced by the computation
 *
 * The library never writes to the console itself. Callers that want to
 * observe selections and hysteresis decisions pass an implementation of this
 * interface. All functions in the library accepting a sink also accept NULL.
 */
class NEUROLAB_DLL_PUBLIC NotificationSink
{
	public :

		virtual ~NotificationSink() { }

		virtual void selection(const Selection&) = 0;

		virtual void hysteresis(const HysteresisDecision&) = 0;
};

} // end namespace neurolab

#endif
