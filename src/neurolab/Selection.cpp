/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include "Selection.hpp"

#include <boost/format.hpp>

#include "exception.hpp"

namespace neurolab {


Selection
Selection::single(nidx_t idx)
{
	return Selection(SINGLE, std::vector<nidx_t>(1, idx));
}



Selection
Selection::tied(const std::vector<nidx_t>& indices)
{
	using boost::format;
	if(indices.size() < 2) {
		throw neurolab::exception(NEUROLAB_LOGIC_ERROR,
				str(format("Tied selection requires at least two indices (got %u)")
					% indices.size()));
	}
	return Selection(TIED, indices);
}



nidx_t
Selection::index() const
{
	if(m_kind != SINGLE) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				"Selection does not have a single winner");
	}
	return m_indices.front();
}



bool
operator==(const Selection& lhs, const Selection& rhs)
{
	return lhs.kind() == rhs.kind() && lhs.indices() == rhs.indices();
}


} // end namespace neurolab


std::ostream& operator<<(std::ostream& o, neurolab::Selection const& sel)
{
	switch(sel.kind()) {
		case neurolab::Selection::NONE :
			return o << "none";
		case neurolab::Selection::SINGLE :
			return o << sel.index();
		case neurolab::Selection::TIED :
		default : {
			const std::vector<nidx_t>& idx = sel.indices();
			o << "{";
			for(std::vector<nidx_t>::const_iterator i = idx.begin(); i != idx.end(); ++i) {
				if(i != idx.begin()) {
					o << ", ";
				}
				o << *i;
			}
			return o << "}";
		}
	}
}
