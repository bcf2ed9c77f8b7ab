/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

/* First include, so that a missing dependency of the header shows up here */
#include <neurolab/MotorEncoder.hpp>

#include <boost/test/unit_test.hpp>

#include <neurolab.hpp>

#include "utils.hpp"


namespace neurolab {
	namespace test {
		namespace motor {


void
testSingle()
{
	BOOST_REQUIRE_EQUAL(direction(0, 10), -4.5);
	BOOST_REQUIRE_EQUAL(direction(9, 10), 4.5);
	BOOST_REQUIRE_EQUAL(direction(8, 10), 3.5);
	BOOST_REQUIRE_EQUAL(direction(2, 5), 0.0);
	BOOST_REQUIRE_EQUAL(direction(0, 1), 0.0);
}



void
testTied()
{
	std::vector<nidx_t> tied;
	tied.push_back(3);
	tied.push_back(8);
	BOOST_REQUIRE_EQUAL(direction(tied, 10), 1.0);
	BOOST_REQUIRE_EQUAL(direction(Selection::tied(tied), 10), 1.0);
}



void
testInvalid()
{
	BOOST_REQUIRE_EXCEPTION(direction(10, 10), neurolab::exception, invalidInput);
	BOOST_REQUIRE_EXCEPTION(direction(0, 0), neurolab::exception, invalidInput);
	BOOST_REQUIRE_EXCEPTION(direction(std::vector<nidx_t>(), 10), neurolab::exception, invalidInput);
	BOOST_REQUIRE_EXCEPTION(direction(Selection::none(), 10), neurolab::exception, invalidInput);
}

}	}	} // end namespaces



BOOST_AUTO_TEST_SUITE(motor)
	BOOST_AUTO_TEST_CASE(single) { neurolab::test::motor::testSingle(); }
	BOOST_AUTO_TEST_CASE(tied) { neurolab::test::motor::testTied(); }
	BOOST_AUTO_TEST_CASE(invalid) { neurolab::test::motor::testInvalid(); }
BOOST_AUTO_TEST_SUITE_END()
