/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Render.hpp"

#include <boost/format.hpp>

#include "exception.hpp"

namespace neurolab {


grid_t
tile(const std::vector<double>& row, unsigned rows)
{
	grid_t grid(boost::extents[rows][row.size()]);
	for(unsigned r=0; r < rows; ++r) {
		for(size_t c=0; c < row.size(); ++c) {
			grid[r][c] = row[c];
		}
	}
	return grid;
}



grid_t
reshape(const Pattern& p, unsigned rows, unsigned cols)
{
	using boost::format;
	if(p.size() != size_t(rows) * size_t(cols)) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				str(format("Cannot lay out pattern of length %u as %ux%u grid")
					% p.size() % rows % cols));
	}

	grid_t grid(boost::extents[rows][cols]);
	for(unsigned r=0; r < rows; ++r) {
		for(unsigned c=0; c < cols; ++c) {
			grid[r][c] = double(p[r * cols + c]);
		}
	}
	return grid;
}

} // end namespace neurolab
