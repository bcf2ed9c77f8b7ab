/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Noise.hpp"

#include <algorithm>
#include <boost/format.hpp>

#include "exception.hpp"

namespace neurolab {


Pattern
NoiseSource::corrupt(const Pattern& original, unsigned flips,
		std::vector<nidx_t>* flipped)
{
	using boost::format;
	typedef boost::variate_generator<rng_t&, boost::uniform_int<> > uirng_t;

	if(flips > original.size()) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Cannot flip %u entries of a pattern of length %u")
					% flips % original.size()));
	}

	/* Partial Fisher-Yates shuffle: the first 'flips' entries of idx end up
	 * as distinct, uniformly drawn indices */
	std::vector<nidx_t> idx(original.size());
	for(nidx_t i=0; i < idx.size(); ++i) {
		idx[i] = i;
	}

	Pattern noisy(original);
	for(unsigned k=0; k < flips; ++k) {
		uirng_t pick(m_rng, boost::uniform_int<>(int(k), int(idx.size()) - 1));
		std::swap(idx[k], idx[pick()]);
		noisy[idx[k]] = -noisy[idx[k]];
	}

	if(flipped != NULL) {
		flipped->assign(idx.begin(), idx.begin() + flips);
	}
	return noisy;
}

} // end namespace neurolab
