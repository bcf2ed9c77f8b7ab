#ifndef NEUROLAB_TEST_UTILS_HPP
#define NEUROLAB_TEST_UTILS_HPP

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>

#include <neurolab.hpp>


/* Predicates for BOOST_REQUIRE_EXCEPTION */
bool invalidInput(const neurolab::exception& e);
bool invalidStepConfig(const neurolab::exception& e);
bool emptyStimulusSet(const neurolab::exception& e);
bool lengthMismatch(const neurolab::exception& e);
bool degenerateSignState(const neurolab::exception& e);
bool logicError(const neurolab::exception& e);


/*! \return vector containing the \a n values pointed to by \a data */
std::vector<double> values(const double* data, size_t n);


/*! Records every notification it receives */
class RecordingSink : public neurolab::NotificationSink
{
	public :

		void selection(const neurolab::Selection& sel) { selections.push_back(sel); }

		void hysteresis(const neurolab::HysteresisDecision& d) { decisions.push_back(d); }

		std::vector<neurolab::Selection> selections;
		std::vector<neurolab::HysteresisDecision> decisions;
};


/*! Write \a contents to a fresh file in the temporary directory
 *
 * \return the file name */
std::string writeTemporaryFile(const std::string& contents);

#endif
