/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "HopfieldMemory.hpp"

#include <boost/format.hpp>
#include <boost/math/special_functions/fpclassify.hpp>

#include "exception.hpp"
#include "log.hpp"

namespace neurolab {


/* Check that a query can be used with a matrix of the given dimension */
void
checkQuery(const Pattern& x, size_t dim)
{
	using boost::format;
	if(x.empty() || x.size() != dim) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				str(format("Pattern of length %u does not match weight matrix of dimension %u")
					% x.size() % dim));
	}
	checkBipolar(x);
}



WeightMatrix
train(const std::vector<Pattern>& patterns, double normalization)
{
	using boost::format;

	if(patterns.empty()) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				"Cannot train on an empty pattern batch");
	}

	if(!boost::math::isfinite(normalization)) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				"Normalization factor must be finite");
	}

	const size_t len = patterns.front().size();
	if(len == 0) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				"Cannot train on zero-length patterns");
	}

	for(size_t p=0; p < patterns.size(); ++p) {
		if(patterns[p].size() != len) {
			throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
					str(format("Pattern %u has length %u, expected %u")
						% p % patterns[p].size() % len));
		}
		checkBipolar(patterns[p]);
	}

	WeightMatrix W(len);

	for(std::vector<Pattern>::const_iterator p = patterns.begin();
			p != patterns.end(); ++p) {
		for(size_t i=0; i < len; ++i) {
			for(size_t j=0; j < len; ++j) {
				W(i,j) += double((*p)[i] * (*p)[j]);
			}
		}
	}

	for(size_t i=0; i < len; ++i) {
		for(size_t j=0; j < len; ++j) {
			W(i,j) /= double(len);
		}
	}

	for(size_t i=0; i < len; ++i) {
		W(i,i) = 0.0;
	}

	for(size_t i=0; i < len; ++i) {
		for(size_t j=0; j < len; ++j) {
			W(i,j) *= normalization;
		}
	}

	LOG("train: %u patterns of length %u\n", unsigned(patterns.size()), unsigned(len));
	return W;
}



unsigned
sweep(Pattern& x, const WeightMatrix& W, sign_policy_t policy)
{
	using boost::format;

	if(x.size() != W.dimension()) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				str(format("Pattern of length %u does not match weight matrix of dimension %u")
					% x.size() % W.dimension()));
	}

	unsigned changed = 0;
	for(size_t i=0, i_end=x.size(); i < i_end; ++i) {
		double h = W.activation(i, x);
		bipolar_t s;
		if(h > 0.0) {
			s = 1;
		} else if(h < 0.0) {
			s = -1;
		} else {
			switch(policy) {
				case NEUROLAB_SIGN_KEEP :
					s = x[i];
					break;
				case NEUROLAB_SIGN_POSITIVE :
					s = 1;
					break;
				case NEUROLAB_SIGN_REJECT :
				default :
					throw neurolab::exception(NEUROLAB_DEGENERATE_SIGN_STATE,
							str(format("Zero activation for neuron %u") % i));
			}
		}
		if(s != x[i]) {
			changed += 1;
		}
		x[i] = s;
	}
	return changed;
}



RecallResult
recallDetailed(const Pattern& query, const WeightMatrix& W, unsigned steps,
		sign_policy_t policy)
{
	checkQuery(query, W.dimension());

	RecallResult r;
	r.state = query;
	for(unsigned k=0; k < steps; ++k) {
		if(sweep(r.state, W, policy) == 0) {
			r.converged = true;
			break;
		}
		r.sweeps += 1;
	}

	LOG("recall: %s after %u sweeps\n",
			r.converged ? "stable" : "not stable", r.sweeps);
	return r;
}



Pattern
recall(const Pattern& query, const WeightMatrix& W, unsigned steps,
		sign_policy_t policy)
{
	return recallDetailed(query, W, steps, policy).state;
}



double
energy(const Pattern& x, const WeightMatrix& W)
{
	using boost::format;
	if(x.size() != W.dimension()) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				str(format("Pattern of length %u does not match weight matrix of dimension %u")
					% x.size() % W.dimension()));
	}

	double e = 0.0;
	for(size_t i=0; i < x.size(); ++i) {
		e += double(x[i]) * W.activation(i, x);
	}
	return -0.5 * e;
}



HopfieldMemory::HopfieldMemory(
		const std::vector<Pattern>& patterns,
		double normalization,
		sign_policy_t policy) :
	m_weights(train(patterns, normalization)),
	m_patternCount(patterns.size()),
	m_policy(policy)
{
	;
}



Pattern
HopfieldMemory::recall(const Pattern& query, unsigned steps) const
{
	return neurolab::recall(query, m_weights, steps, m_policy);
}



RecallResult
HopfieldMemory::recallDetailed(const Pattern& query, unsigned steps) const
{
	return neurolab::recallDetailed(query, m_weights, steps, m_policy);
}



double
HopfieldMemory::energy(const Pattern& x) const
{
	return neurolab::energy(x, m_weights);
}

} // end namespace neurolab
