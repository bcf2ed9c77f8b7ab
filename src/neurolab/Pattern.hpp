#ifndef NEUROLAB_PATTERN_HPP
#define NEUROLAB_PATTERN_HPP

//! \file Pattern.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <cstddef>
#include <string>
#include <vector>

#include <neurolab/config.h>
#include <neurolab/types.h>

namespace neurolab {

/*! Bipolar pattern. Entries are -1 or +1. Two-dimensional patterns are
 * stored in row-major order. */
typedef std::vector<bipolar_t> Pattern;


/*! \brief Supplier of a fixed batch of named patterns
 *
 * All patterns in a source have the same length, rows() * columns().
 */
class NEUROLAB_DLL_PUBLIC PatternSource
{
	public :

		virtual ~PatternSource() { }

		virtual size_t patternCount() const = 0;

		/*! \return pattern \a i, 0 <= i < patternCount() */
		virtual const Pattern& pattern(size_t i) const = 0;

		virtual std::string name(size_t i) const = 0;

		virtual unsigned rows() const = 0;

		virtual unsigned columns() const = 0;
};


/*! \return all patterns of a source, in order */
NEUROLAB_DLL_PUBLIC
std::vector<Pattern>
patterns(const PatternSource& source);


/*! \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if any entry of \a p
 * 		is not -1 or +1 */
NEUROLAB_DLL_PUBLIC
void
checkBipolar(const Pattern& p);


/*! \return number of positions at which \a a and \a b differ
 *
 * \throws neurolab::exception (NEUROLAB_LENGTH_MISMATCH) if the lengths differ
 */
NEUROLAB_DLL_PUBLIC
unsigned
hammingDistance(const Pattern& a, const Pattern& b);

} // end namespace neurolab

#endif
