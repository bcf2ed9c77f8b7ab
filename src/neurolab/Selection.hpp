#ifndef NEUROLAB_SELECTION_HPP
#define NEUROLAB_SELECTION_HPP

//! \file Selection.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ostream>
#include <vector>

#include <neurolab/config.h>
#include <neurolab/types.h>

namespace neurolab {

/*! \brief Outcome of a stimulus selection
 *
 * Either a single winning index, a set of (at least two) tied indices, or no
 * selection at all. Indices are stored in increasing order. */
class NEUROLAB_DLL_PUBLIC Selection
{
	public :

		enum kind_t {
			NONE,
			SINGLE,
			TIED
		};

		/*! Create an empty selection */
		Selection() : m_kind(NONE) { }

		static Selection none() { return Selection(); }

		static Selection single(nidx_t idx);

		/*! \pre \a indices has at least two entries, sorted */
		static Selection tied(const std::vector<nidx_t>& indices);

		kind_t kind() const { return m_kind; }

		bool empty() const { return m_kind == NONE; }

		const std::vector<nidx_t>& indices() const { return m_indices; }

		/*! \return the winning index
		 * \throws neurolab::exception if this is not a single selection */
		nidx_t index() const;

	private :

		Selection(kind_t kind, const std::vector<nidx_t>& indices) :
			m_kind(kind), m_indices(indices) { }

		kind_t m_kind;

		std::vector<nidx_t> m_indices;
};


NEUROLAB_DLL_PUBLIC
bool operator==(const Selection& lhs, const Selection& rhs);


} // end namespace neurolab


NEUROLAB_DLL_PUBLIC
std::ostream& operator<<(std::ostream& o, neurolab::Selection const& sel);

#endif
