#ifndef NEUROLAB_RENDER_HPP
#define NEUROLAB_RENDER_HPP

//! \file Render.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <string>
#include <vector>
#include <boost/multi_array.hpp>

#include <neurolab/config.h>
#include <neurolab/Pattern.hpp>

namespace neurolab {

typedef boost::multi_array<double, 2> grid_t;


/*! \brief Presentation of computed results
 *
 * Rendering does not affect any computed result. Implementations may throw
 * on failure; callers treat such failures as non-fatal.
 */
class NEUROLAB_DLL_PUBLIC RenderSink
{
	public :

		virtual ~RenderSink() { }

		virtual void renderGrid(const grid_t& grid, const std::string& title) = 0;

		/*! \pre \a x and \a y have the same length */
		virtual void renderSeries(
				const std::vector<double>& x,
				const std::vector<double>& y,
				const std::string& title) = 0;
};


/*! \return grid with \a rows copies of \a row */
NEUROLAB_DLL_PUBLIC
grid_t
tile(const std::vector<double>& row, unsigned rows);


/*! \return \a p laid out as a \a rows x \a cols grid in row-major order
 * \throws neurolab::exception (NEUROLAB_LENGTH_MISMATCH) if the pattern
 * 		length is not rows * cols */
NEUROLAB_DLL_PUBLIC
grid_t
reshape(const Pattern& p, unsigned rows, unsigned cols);

} // end namespace neurolab

#endif
