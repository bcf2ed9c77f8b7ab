/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/format.hpp>

#include <neurolab/exception.hpp>
#include "digits.hpp"

#define DIGIT_CELLS 25

static const int s_digits[10][DIGIT_CELLS] = {
	{ -1, 1, 1, 1,-1,
	   1,-1,-1,-1, 1,
	   1,-1,-1,-1, 1,
	   1,-1,-1,-1, 1,
	  -1, 1, 1, 1,-1 },
	{ -1,-1, 1,-1,-1,
	  -1, 1, 1,-1,-1,
	  -1,-1, 1,-1,-1,
	  -1,-1, 1,-1,-1,
	  -1, 1, 1, 1,-1 },
	{  1, 1, 1, 1, 1,
	  -1,-1,-1,-1, 1,
	  -1, 1, 1, 1,-1,
	   1,-1,-1,-1,-1,
	   1, 1, 1, 1, 1 },
	{ -1, 1, 1, 1,-1,
	  -1,-1,-1,-1, 1,
	  -1, 1, 1, 1,-1,
	  -1,-1,-1,-1, 1,
	  -1, 1, 1, 1,-1 },
	{  1,-1,-1, 1,-1,
	   1,-1,-1, 1,-1,
	   1, 1, 1, 1, 1,
	  -1,-1,-1, 1,-1,
	  -1,-1,-1, 1,-1 },
	{ -1, 1, 1, 1, 1,
	   1,-1,-1,-1,-1,
	  -1, 1, 1, 1,-1,
	  -1,-1,-1,-1, 1,
	   1, 1, 1, 1,-1 },
	{ -1, 1,-1,-1,-1,
	  -1, 1,-1,-1,-1,
	  -1, 1, 1, 1,-1,
	  -1, 1,-1,-1, 1,
	  -1, 1, 1, 1,-1 },
	{  1, 1, 1, 1, 1,
	  -1,-1,-1, 1,-1,
	  -1,-1, 1,-1,-1,
	  -1, 1,-1,-1,-1,
	   1,-1,-1,-1,-1 },
	{  1, 1, 1,-1,-1,
	   1,-1, 1,-1,-1,
	   1, 1, 1,-1,-1,
	   1,-1, 1,-1,-1,
	   1, 1, 1,-1,-1 },
	{ -1,-1, 1, 1, 1,
	  -1, 1,-1,-1, 1,
	  -1,-1, 1, 1, 1,
	  -1,-1,-1,-1, 1,
	  -1,-1,-1,-1, 1 }
};



DigitPatterns::DigitPatterns(unsigned first) :
	m_first(first)
{
	using boost::format;

	if(first != 0 && first != 5) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Digit batches start at 0 or 5, not %u") % first));
	}

	for(unsigned d=first; d < first+5; ++d) {
		m_patterns.push_back(neurolab::Pattern(s_digits[d], s_digits[d] + DIGIT_CELLS));
	}
}



const neurolab::Pattern&
DigitPatterns::pattern(size_t i) const
{
	using boost::format;
	if(i >= m_patterns.size()) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Invalid digit index %u in batch starting at %u") % i % m_first));
	}
	return m_patterns[i];
}



std::string
DigitPatterns::name(size_t i) const
{
	return str(boost::format("digit %u") % (m_first + i));
}
