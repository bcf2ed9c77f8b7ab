/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Pattern.hpp"

#include <boost/format.hpp>

#include "exception.hpp"

namespace neurolab {


std::vector<Pattern>
patterns(const PatternSource& source)
{
	std::vector<Pattern> ret;
	ret.reserve(source.patternCount());
	for(size_t i=0; i < source.patternCount(); ++i) {
		ret.push_back(source.pattern(i));
	}
	return ret;
}



void
checkBipolar(const Pattern& p)
{
	using boost::format;
	for(size_t i=0; i < p.size(); ++i) {
		if(p[i] != 1 && p[i] != -1) {
			throw neurolab::exception(NEUROLAB_INVALID_INPUT,
					str(format("Pattern entry %u has non-bipolar value %d") % i % p[i]));
		}
	}
}



unsigned
hammingDistance(const Pattern& a, const Pattern& b)
{
	using boost::format;
	if(a.size() != b.size()) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				str(format("Cannot compare patterns of length %u and %u")
					% a.size() % b.size()));
	}

	unsigned d = 0;
	for(size_t i=0; i < a.size(); ++i) {
		if(a[i] != b[i]) {
			d += 1;
		}
	}
	return d;
}

} // end namespace neurolab
