#ifndef NEUROLAB_EXCEPTION_HPP
#define NEUROLAB_EXCEPTION_HPP

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <stdexcept>
#include <string>

#include <neurolab/errors.h>

namespace neurolab {

/* Minor extension of std::exception which adds an error number. The error
 * numbers are listed in errors.h. */
class exception : public std::runtime_error
{
	public :

		exception(int errorNumber, const std::string& msg) :
			std::runtime_error(msg),
			m_errno(errorNumber) {}

		~exception() throw () {}

		int errorNumber() const { return m_errno; }

	private :

		int m_errno;
};


} // end namespace neurolab

#endif
