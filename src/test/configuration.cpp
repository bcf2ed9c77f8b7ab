/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <set>
#include <sstream>
#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>

#include <neurolab.hpp>
#include <digits.hpp>

#include "utils.hpp"


namespace neurolab {
	namespace test {
		namespace noise {


void
testCorrupt()
{
	DigitPatterns digits(0);
	const Pattern& original = digits.pattern(1);

	NoiseSource source(1234);
	std::vector<nidx_t> flipped;
	Pattern noisy = source.corrupt(original, 3, &flipped);

	BOOST_REQUIRE_EQUAL(noisy.size(), original.size());
	BOOST_REQUIRE_EQUAL(hammingDistance(noisy, original), 3U);
	BOOST_REQUIRE_EQUAL(flipped.size(), 3U);
	BOOST_REQUIRE_EQUAL(std::set<nidx_t>(flipped.begin(), flipped.end()).size(), 3U);
	for(std::vector<nidx_t>::const_iterator i = flipped.begin(); i != flipped.end(); ++i) {
		BOOST_REQUIRE(*i < original.size());
		BOOST_REQUIRE_EQUAL(noisy[*i], -original[*i]);
	}
}



void
testReproducible()
{
	DigitPatterns digits(5);

	NoiseSource a(42);
	NoiseSource b(42);
	for(size_t d=0; d < digits.patternCount(); ++d) {
		BOOST_REQUIRE(a.corrupt(digits.pattern(d), 2) == b.corrupt(digits.pattern(d), 2));
	}
}



void
testLimits()
{
	DigitPatterns digits(0);
	const Pattern& original = digits.pattern(0);
	NoiseSource source;

	BOOST_REQUIRE(source.corrupt(original, 0) == original);

	Pattern inverted = source.corrupt(original, 25);
	BOOST_REQUIRE_EQUAL(hammingDistance(inverted, original), 25U);

	BOOST_REQUIRE_EXCEPTION(source.corrupt(original, 26), neurolab::exception, invalidInput);
}

}	}	} // end namespaces



namespace neurolab {
	namespace test {
		namespace configuration {


void
testDefaults()
{
	Configuration conf;
	BOOST_REQUIRE(!conf.loggingEnabled());
	BOOST_REQUIRE_EQUAL(conf.tau(), 10.0);
	BOOST_REQUIRE_EQUAL(conf.restingPotential(), -65.0);
	BOOST_REQUIRE_EQUAL(conf.initialPotential(), -70.0);
	BOOST_REQUIRE_EQUAL(conf.stepSize(), 0.1);
	BOOST_REQUIRE_EQUAL(conf.startTime(), 0.0);
	BOOST_REQUIRE_EQUAL(conf.endTime(), 100.0);
	BOOST_REQUIRE_EQUAL(conf.inputGain(), 10.0);
	BOOST_REQUIRE_EQUAL(conf.tieTolerance(), 0.0);
	BOOST_REQUIRE_EQUAL(conf.hysteresisThreshold(), 0.75);
	BOOST_REQUIRE_EQUAL(conf.streamingThreshold(), 0.5);
	BOOST_REQUIRE_EQUAL(conf.normalizationFactor(), 0.05);
	BOOST_REQUIRE_EQUAL(conf.recallSteps(), 50U);
	BOOST_REQUIRE(!conf.noiseFlipCountSet());
	BOOST_REQUIRE_EXCEPTION(conf.noiseFlipCount(), neurolab::exception, logicError);
	BOOST_REQUIRE_EQUAL(conf.signPolicy(), NEUROLAB_SIGN_KEEP);
	BOOST_REQUIRE_EQUAL(conf.seed(), 0U);
}



void
testSetters()
{
	Configuration conf;
	conf.setMembrane(20.0, -60.0);
	conf.setNoiseFlipCount(4);
	conf.setSignPolicy(NEUROLAB_SIGN_REJECT);

	Configuration copy(conf);
	conf.setMembrane(5.0, -50.0);

	BOOST_REQUIRE_EQUAL(copy.tau(), 20.0);
	BOOST_REQUIRE_EQUAL(copy.restingPotential(), -60.0);
	BOOST_REQUIRE_EQUAL(copy.noiseFlipCount(), 4U);
	BOOST_REQUIRE_EQUAL(copy.signPolicy(), NEUROLAB_SIGN_REJECT);
	BOOST_REQUIRE_EQUAL(conf.tau(), 5.0);

	BOOST_REQUIRE_EXCEPTION(conf.setMembrane(0.0, -65.0), neurolab::exception, invalidInput);
	BOOST_REQUIRE_EXCEPTION(conf.setStepSize(0.0), neurolab::exception, invalidStepConfig);
	BOOST_REQUIRE_EXCEPTION(conf.setSimulationTime(10.0, 0.0), neurolab::exception, invalidStepConfig);
	BOOST_REQUIRE_EXCEPTION(conf.setTieTolerance(-0.5), neurolab::exception, invalidInput);

	/* failed setters leave the old values in place */
	BOOST_REQUIRE_EQUAL(conf.tau(), 5.0);
	BOOST_REQUIRE_EQUAL(conf.stepSize(), 0.1);
	BOOST_REQUIRE_EQUAL(conf.endTime(), 100.0);

	std::ostringstream out;
	out << copy;
	BOOST_REQUIRE(out.str().find("tau=20") != std::string::npos);
	BOOST_REQUIRE(out.str().find("sign=reject") != std::string::npos);
	BOOST_REQUIRE(out.str().find("flips=4") != std::string::npos);
}



void
testSignPolicyNames()
{
	const sign_policy_t policies[] = { NEUROLAB_SIGN_KEEP, NEUROLAB_SIGN_POSITIVE, NEUROLAB_SIGN_REJECT };
	for(unsigned i=0; i < 3; ++i) {
		BOOST_REQUIRE_EQUAL(parseSignPolicy(signPolicyName(policies[i])), policies[i]);
	}
	BOOST_REQUIRE_EXCEPTION(parseSignPolicy("zero"), neurolab::exception, invalidInput);
}



void
testLoadFile()
{
	std::string name = writeTemporaryFile(
			"# membrane\n"
			"tau = 20\n"
			"v-rest = -60\n"
			"step-size = 0.05\n"
			"t-end = 50\n"
			"threshold = 0.6\n"
			"recall-steps = 10\n"
			"noise-flip-count = 3\n"
			"sign-policy = positive\n"
			"seed = 42\n"
			"logging = true\n");

	Configuration conf;
	loadConfigurationFile(name, conf);
	boost::filesystem::remove(name);

	BOOST_REQUIRE(conf.loggingEnabled());
	BOOST_REQUIRE_EQUAL(conf.tau(), 20.0);
	BOOST_REQUIRE_EQUAL(conf.restingPotential(), -60.0);
	BOOST_REQUIRE_EQUAL(conf.stepSize(), 0.05);
	BOOST_REQUIRE_EQUAL(conf.startTime(), 0.0);
	BOOST_REQUIRE_EQUAL(conf.endTime(), 50.0);
	BOOST_REQUIRE_EQUAL(conf.hysteresisThreshold(), 0.6);
	BOOST_REQUIRE_EQUAL(conf.recallSteps(), 10U);
	BOOST_REQUIRE_EQUAL(conf.noiseFlipCount(), 3U);
	BOOST_REQUIRE_EQUAL(conf.signPolicy(), NEUROLAB_SIGN_POSITIVE);
	BOOST_REQUIRE_EQUAL(conf.seed(), 42U);

	/* keys not present keep their defaults */
	BOOST_REQUIRE_EQUAL(conf.initialPotential(), -70.0);
	BOOST_REQUIRE_EQUAL(conf.normalizationFactor(), 0.05);
}



void
requireRejected(const std::string& contents)
{
	std::string name = writeTemporaryFile(contents);
	Configuration conf;
	BOOST_REQUIRE_EXCEPTION(loadConfigurationFile(name, conf), neurolab::exception, invalidInput);
	boost::filesystem::remove(name);
}



void
testInvalidFile()
{
	Configuration conf;
	BOOST_REQUIRE_EXCEPTION(loadConfigurationFile("/nonexistent/neurolab.ini", conf),
			neurolab::exception, invalidInput);

	requireRejected("frequency = 12\n");
	requireRejected("tau = fast\n");
	requireRejected("tau = -1\n");
	requireRejected("sign-policy = zero\n");
}

void
testFailedLoadIsAtomic()
{
	/* tau is valid, the time interval is not */
	std::string name = writeTemporaryFile(
			"tau = 20\n"
			"t-start = 50\n"
			"t-end = 10\n");

	Configuration conf;
	conf.setSeed(7);
	BOOST_REQUIRE_EXCEPTION(loadConfigurationFile(name, conf), neurolab::exception, invalidStepConfig);
	boost::filesystem::remove(name);

	BOOST_REQUIRE_EQUAL(conf.tau(), 10.0);
	BOOST_REQUIRE_EQUAL(conf.startTime(), 0.0);
	BOOST_REQUIRE_EQUAL(conf.endTime(), 100.0);
	BOOST_REQUIRE_EQUAL(conf.seed(), 7U);
}



void
testSwap()
{
	Configuration a;
	Configuration b;
	b.setMembrane(20.0, -60.0);
	a.swap(b);
	BOOST_REQUIRE_EQUAL(a.tau(), 20.0);
	BOOST_REQUIRE_EQUAL(b.tau(), 10.0);
}

}	}	} // end namespaces



BOOST_AUTO_TEST_SUITE(noise)
	BOOST_AUTO_TEST_CASE(corrupt) { neurolab::test::noise::testCorrupt(); }
	BOOST_AUTO_TEST_CASE(reproducible) { neurolab::test::noise::testReproducible(); }
	BOOST_AUTO_TEST_CASE(limits) { neurolab::test::noise::testLimits(); }
BOOST_AUTO_TEST_SUITE_END()


BOOST_AUTO_TEST_SUITE(configuration)
	BOOST_AUTO_TEST_CASE(defaults) { neurolab::test::configuration::testDefaults(); }
	BOOST_AUTO_TEST_CASE(setters) { neurolab::test::configuration::testSetters(); }
	BOOST_AUTO_TEST_CASE(swap_settings) { neurolab::test::configuration::testSwap(); }
	BOOST_AUTO_TEST_CASE(sign_policy_names) { neurolab::test::configuration::testSignPolicyNames(); }
	BOOST_AUTO_TEST_SUITE(file)
		BOOST_AUTO_TEST_CASE(load) { neurolab::test::configuration::testLoadFile(); }
		BOOST_AUTO_TEST_CASE(invalid) { neurolab::test::configuration::testInvalidFile(); }
		BOOST_AUTO_TEST_CASE(failed_load_is_atomic) { neurolab::test::configuration::testFailedLoadIsAtomic(); }
	BOOST_AUTO_TEST_SUITE_END()
BOOST_AUTO_TEST_SUITE_END()
