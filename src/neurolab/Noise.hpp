#ifndef NEUROLAB_NOISE_HPP
#define NEUROLAB_NOISE_HPP

//! \file Noise.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <vector>
#include <boost/random.hpp>

#include <neurolab/config.h>
#include <neurolab/Pattern.hpp>

namespace neurolab {

/*! \brief Seeded source of pattern corruption
 *
 * Each call to \a corrupt draws a fresh set of indices from the same
 * generator, so a sequence of calls is reproducible for a given seed.
 */
class NEUROLAB_DLL_PUBLIC NoiseSource
{
	public :

		typedef boost::mt19937 rng_t;

		explicit NoiseSource(unsigned seed = 0) : m_rng(seed) { }

		/*! \return copy of \a original with \a flips distinct entries negated
		 *
		 * \param flipped if not NULL, receives the negated indices in the
		 * 		order they were drawn
		 *
		 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if \a flips
		 * 		exceeds the pattern length
		 */
		Pattern corrupt(const Pattern& original, unsigned flips,
				std::vector<nidx_t>* flipped = NULL);

	private :

		rng_t m_rng;
};

} // end namespace neurolab

#endif
