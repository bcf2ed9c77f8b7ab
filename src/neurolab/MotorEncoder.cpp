/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "MotorEncoder.hpp"

#include <boost/format.hpp>

#include "Selection.hpp"
#include "exception.hpp"

namespace neurolab {


double
direction(nidx_t idx, size_t n)
{
	using boost::format;

	if(n == 0) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				"Cannot encode direction in an empty visual field");
	}

	if(idx >= n) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Stimulus index %u outside visual field of size %u") % idx % n));
	}

	return double(idx) - double(n - 1) / 2.0;
}



double
direction(const std::vector<nidx_t>& indices, size_t n)
{
	if(indices.empty()) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				"Cannot encode direction without a selected stimulus");
	}

	double sum = 0.0;
	for(std::vector<nidx_t>::const_iterator i = indices.begin();
			i != indices.end(); ++i) {
		sum += direction(*i, n);
	}
	return sum / double(indices.size());
}



double
direction(const Selection& sel, size_t n)
{
	return direction(sel.indices(), n);
}

} // end namespace neurolab
