#ifndef NEUROLAB_EXAMPLES_DIGITS_HPP
#define NEUROLAB_EXAMPLES_DIGITS_HPP

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <vector>
#include <string>

#include <neurolab/Pattern.hpp>


/*! The decimal digits drawn on a 5x5 bipolar grid, in two batches of five
 * (0-4 and 5-9) */
class DigitPatterns : public neurolab::PatternSource
{
	public :

		/*! \param first first digit of the batch, either 0 or 5
		 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) for any other
		 * 		value */
		explicit DigitPatterns(unsigned first);

		size_t patternCount() const { return m_patterns.size(); }

		/*! \throws neurolab::exception if \a i is out of range */
		const neurolab::Pattern& pattern(size_t i) const;

		std::string name(size_t i) const;

		unsigned rows() const { return 5; }

		unsigned columns() const { return 5; }

		unsigned firstDigit() const { return m_first; }

	private :

		unsigned m_first;

		std::vector<neurolab::Pattern> m_patterns;
};

#endif
