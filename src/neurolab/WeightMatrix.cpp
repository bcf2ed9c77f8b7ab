/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "WeightMatrix.hpp"

namespace neurolab {


double
WeightMatrix::activation(size_t i, const Pattern& x) const
{
	double h = 0.0;
	for(size_t j=0, j_end=x.size(); j < j_end; ++j) {
		h += m_w[i][j] * double(x[j]);
	}
	return h;
}

} // end namespace neurolab
