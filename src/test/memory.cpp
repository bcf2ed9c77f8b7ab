/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cmath>
#include <set>
#include <boost/test/unit_test.hpp>

#include <neurolab.hpp>
#include <digits.hpp>

#include "utils.hpp"


namespace neurolab {
	namespace test {
		namespace memory {


HopfieldMemory
storeBatch(const DigitPatterns& digits, sign_policy_t policy = NEUROLAB_SIGN_KEEP)
{
	return HopfieldMemory(patterns(digits), 0.05, policy);
}



void
testWeights()
{
	DigitPatterns digits(0);
	WeightMatrix W = train(patterns(digits), 0.05);

	BOOST_REQUIRE_EQUAL(W.dimension(), 25U);

	BOOST_REQUIRE_EQUAL(W(0,0), 0.0);
	BOOST_REQUIRE_CLOSE(W(0,1), -0.002, 1e-9);
	BOOST_REQUIRE_CLOSE(W(0,2), -0.006, 1e-9);
	BOOST_REQUIRE_CLOSE(W(0,3), 0.002, 1e-9);
	BOOST_REQUIRE_CLOSE(W(0,4), 0.006, 1e-9);
	BOOST_REQUIRE_CLOSE(W(0,5), 0.002, 1e-9);

	/* five patterns give sums in {-5, -3, -1, 1, 3, 5} */
	const double allowed[] = { -0.01, -0.006, -0.002, 0.002, 0.006, 0.01 };
	for(size_t i=0; i < W.dimension(); ++i) {
		BOOST_REQUIRE_EQUAL(W(i,i), 0.0);
		for(size_t j=0; j < W.dimension(); ++j) {
			BOOST_REQUIRE_EQUAL(W(i,j), W(j,i));
			if(i != j) {
				bool found = false;
				for(unsigned k=0; k < 6; ++k) {
					found = found || std::fabs(W(i,j) - allowed[k]) < 1e-12;
				}
				BOOST_REQUIRE(found);
			}
		}
	}
}



void
testSinglePattern()
{
	Pattern p;
	p.push_back(1); p.push_back(-1); p.push_back(1); p.push_back(-1);

	WeightMatrix W = train(std::vector<Pattern>(1, p), 1.0);
	BOOST_REQUIRE_CLOSE(W(0,2), 0.25, 1e-9);
	BOOST_REQUIRE_CLOSE(W(0,1), -0.25, 1e-9);

	/* the negated pattern is an attractor as well */
	Pattern q(p);
	for(size_t i=0; i < q.size(); ++i) {
		q[i] = -q[i];
	}
	BOOST_REQUIRE(recall(q, W, 10) == q);

	Pattern noisy(p);
	noisy[1] = 1;
	RecallResult r = recallDetailed(noisy, W, 10);
	BOOST_REQUIRE(r.state == p);
	BOOST_REQUIRE_EQUAL(r.sweeps, 1U);
	BOOST_REQUIRE(r.converged);
}



void
testOrthogonalPatterns()
{
	/* first rows of a 16x16 Hadamard matrix */
	std::vector<Pattern> stored(3, Pattern(16, 1));
	for(unsigned i=0; i < 16; ++i) {
		stored[1][i] = i % 2 ? -1 : 1;
		stored[2][i] = (i / 2) % 2 ? -1 : 1;
	}
	HopfieldMemory memory(stored, 0.05, NEUROLAB_SIGN_REJECT);

	for(unsigned p=0; p < stored.size(); ++p) {
		BOOST_REQUIRE(memory.recall(stored[p], 50) == stored[p]);
		for(unsigned i=0; i < 16; ++i) {
			Pattern noisy(stored[p]);
			noisy[i] = -noisy[i];
			BOOST_REQUIRE(memory.recall(noisy, 50) == stored[p]);
		}
	}
}



/* Every stored digit is a fixed point of its own memory */
void
testFixedPoints(unsigned first)
{
	DigitPatterns digits(first);
	HopfieldMemory memory = storeBatch(digits);

	BOOST_REQUIRE_EQUAL(memory.dimension(), 25U);
	BOOST_REQUIRE_EQUAL(memory.patternCount(), 5U);

	for(size_t d=0; d < digits.patternCount(); ++d) {
		const Pattern& p = digits.pattern(d);
		RecallResult r = memory.recallDetailed(p, 50);
		BOOST_REQUIRE(r.state == p);
		BOOST_REQUIRE_EQUAL(r.sweeps, 0U);
		BOOST_REQUIRE(r.converged);
	}
}



/*! Flip each entry of a digit in turn and check which single-flip queries
 * are not restored */
std::set<unsigned>
singleFlipFailures(unsigned digit)
{
	DigitPatterns digits(digit < 5 ? 0 : 5);
	HopfieldMemory memory = storeBatch(digits);
	const Pattern& original = digits.pattern(digit % 5);

	std::set<unsigned> failures;
	for(unsigned i=0; i < original.size(); ++i) {
		Pattern q(original);
		q[i] = -q[i];
		if(hammingDistance(memory.recall(q, 50), original) != 0) {
			failures.insert(i);
		}
	}
	return failures;
}



void
testSingleFlips()
{
	/* robust digits */
	const unsigned robust[] = { 3, 4, 5, 7, 8, 9 };
	for(unsigned k=0; k < 6; ++k) {
		BOOST_REQUIRE(singleFlipFailures(robust[k]).empty());
	}

	std::set<unsigned> one = singleFlipFailures(1);
	BOOST_REQUIRE_EQUAL(one.size(), 1U);
	BOOST_REQUIRE_EQUAL(*one.begin(), 9U);

	std::set<unsigned> six = singleFlipFailures(6);
	BOOST_REQUIRE_EQUAL(six.size(), 1U);
	BOOST_REQUIRE_EQUAL(*six.begin(), 4U);

	const unsigned zeroFailures[] = { 10, 12, 13, 14, 19 };
	std::set<unsigned> zero = singleFlipFailures(0);
	BOOST_REQUIRE(zero == std::set<unsigned>(zeroFailures, zeroFailures + 5));

	const unsigned twoFailures[] = { 4, 11, 13, 19, 20, 23, 24 };
	std::set<unsigned> two = singleFlipFailures(2);
	BOOST_REQUIRE(two == std::set<unsigned>(twoFailures, twoFailures + 7));
}



void
testRecovery()
{
	DigitPatterns digits(0);
	HopfieldMemory memory = storeBatch(digits);
	const Pattern& three = digits.pattern(3);

	Pattern noisy(three);
	noisy[0] = -noisy[0];
	noisy[7] = -noisy[7];
	BOOST_REQUIRE_EQUAL(hammingDistance(noisy, three), 2U);

	RecallResult r = memory.recallDetailed(noisy, 50);
	BOOST_REQUIRE(r.state == three);
	BOOST_REQUIRE_EQUAL(r.sweeps, 1U);
	BOOST_REQUIRE(r.converged);

	/* the sweep which would confirm stability is not performed */
	RecallResult budget = memory.recallDetailed(noisy, 1);
	BOOST_REQUIRE(budget.state == three);
	BOOST_REQUIRE_EQUAL(budget.sweeps, 1U);
	BOOST_REQUIRE(!budget.converged);

	/* no sweeps at all leaves the query untouched */
	RecallResult none = memory.recallDetailed(noisy, 0);
	BOOST_REQUIRE(none.state == noisy);
	BOOST_REQUIRE_EQUAL(none.sweeps, 0U);
	BOOST_REQUIRE(!none.converged);

	/* the stored digit lies lower on the energy surface */
	BOOST_REQUIRE_CLOSE(memory.energy(three), -0.84, 1e-6);
	BOOST_REQUIRE_CLOSE(memory.energy(noisy), -0.584, 1e-6);
}



void
testSignPolicies()
{
	DigitPatterns digits(0);
	const Pattern& two = digits.pattern(2);

	/* digit 2 has an exactly zero activation during its first sweep */
	HopfieldMemory keep = storeBatch(digits, NEUROLAB_SIGN_KEEP);
	BOOST_REQUIRE(keep.recall(two, 50) == two);
	BOOST_REQUIRE_EQUAL(keep.signPolicy(), NEUROLAB_SIGN_KEEP);

	HopfieldMemory positive = storeBatch(digits, NEUROLAB_SIGN_POSITIVE);
	RecallResult r = positive.recallDetailed(two, 50);
	BOOST_REQUIRE(r.state != two);
	BOOST_REQUIRE_EQUAL(r.sweeps, 2U);
	BOOST_REQUIRE(r.converged);

	HopfieldMemory reject = storeBatch(digits, NEUROLAB_SIGN_REJECT);
	BOOST_REQUIRE_EXCEPTION(reject.recall(two, 50), neurolab::exception, degenerateSignState);

	/* digits without zero activations are unaffected */
	const Pattern& three = digits.pattern(3);
	BOOST_REQUIRE(reject.recall(three, 50) == three);
	BOOST_REQUIRE(positive.recall(three, 50) == three);
}



void
testInvalidPatterns()
{
	std::vector<Pattern> none;
	BOOST_REQUIRE_EXCEPTION(train(none, 0.05), neurolab::exception, lengthMismatch);
	BOOST_REQUIRE_EXCEPTION(train(std::vector<Pattern>(2, Pattern()), 0.05), neurolab::exception, lengthMismatch);

	std::vector<Pattern> mixed;
	mixed.push_back(Pattern(4, 1));
	mixed.push_back(Pattern(5, 1));
	BOOST_REQUIRE_EXCEPTION(train(mixed, 0.05), neurolab::exception, lengthMismatch);

	std::vector<Pattern> ternary(1, Pattern(4, 1));
	ternary[0][2] = 0;
	BOOST_REQUIRE_EXCEPTION(train(ternary, 0.05), neurolab::exception, invalidInput);
	BOOST_REQUIRE_EXCEPTION(train(std::vector<Pattern>(1, Pattern(4, 1)), HUGE_VAL), neurolab::exception, invalidInput);

	DigitPatterns digits(5);
	HopfieldMemory memory = storeBatch(digits);
	BOOST_REQUIRE_EXCEPTION(memory.recall(Pattern(24, 1), 50), neurolab::exception, lengthMismatch);
	BOOST_REQUIRE_EXCEPTION(memory.recall(Pattern(), 50), neurolab::exception, lengthMismatch);
	BOOST_REQUIRE_EXCEPTION(memory.recall(Pattern(25, 2), 50), neurolab::exception, invalidInput);
	BOOST_REQUIRE_EXCEPTION(memory.energy(Pattern(24, 1)), neurolab::exception, lengthMismatch);

	Pattern x(24, 1);
	BOOST_REQUIRE_EXCEPTION(sweep(x, memory.weights()), neurolab::exception, lengthMismatch);
	BOOST_REQUIRE_EXCEPTION(hammingDistance(Pattern(3, 1), Pattern(4, 1)), neurolab::exception, lengthMismatch);

	BOOST_REQUIRE_EXCEPTION(DigitPatterns(3), neurolab::exception, invalidInput);
}



void
testLayout()
{
	DigitPatterns digits(0);
	grid_t grid = reshape(digits.pattern(0), digits.rows(), digits.columns());
	BOOST_REQUIRE_EQUAL(grid.shape()[0], 5U);
	BOOST_REQUIRE_EQUAL(grid.shape()[1], 5U);
	BOOST_REQUIRE_EQUAL(grid[0][0], -1.0);
	BOOST_REQUIRE_EQUAL(grid[0][1], 1.0);
	BOOST_REQUIRE_EQUAL(grid[1][0], 1.0);
	BOOST_REQUIRE_EQUAL(grid[4][4], -1.0);
	BOOST_REQUIRE_EXCEPTION(reshape(digits.pattern(0), 4, 5), neurolab::exception, lengthMismatch);

	std::vector<double> row(3, 0.5);
	row[1] = 0.9;
	grid_t tiled = tile(row, 2);
	BOOST_REQUIRE_EQUAL(tiled.shape()[0], 2U);
	BOOST_REQUIRE_EQUAL(tiled.shape()[1], 3U);
	BOOST_REQUIRE_EQUAL(tiled[1][1], 0.9);
}

}	}	} // end namespaces



BOOST_AUTO_TEST_SUITE(hopfield)
	BOOST_AUTO_TEST_CASE(weights) { neurolab::test::memory::testWeights(); }
	BOOST_AUTO_TEST_CASE(single_pattern) { neurolab::test::memory::testSinglePattern(); }
	BOOST_AUTO_TEST_CASE(orthogonal) { neurolab::test::memory::testOrthogonalPatterns(); }
	BOOST_AUTO_TEST_SUITE(fixed_points)
		BOOST_AUTO_TEST_CASE(digits_0_4) { neurolab::test::memory::testFixedPoints(0); }
		BOOST_AUTO_TEST_CASE(digits_5_9) { neurolab::test::memory::testFixedPoints(5); }
	BOOST_AUTO_TEST_SUITE_END()
	BOOST_AUTO_TEST_CASE(single_flips) { neurolab::test::memory::testSingleFlips(); }
	BOOST_AUTO_TEST_CASE(recovery) { neurolab::test::memory::testRecovery(); }
	BOOST_AUTO_TEST_CASE(sign_policies) { neurolab::test::memory::testSignPolicies(); }
	BOOST_AUTO_TEST_CASE(invalid) { neurolab::test::memory::testInvalidPatterns(); }
	BOOST_AUTO_TEST_CASE(layout) { neurolab::test::memory::testLayout(); }
BOOST_AUTO_TEST_SUITE_END()
