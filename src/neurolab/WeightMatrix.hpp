#ifndef NEUROLAB_WEIGHT_MATRIX_HPP
#define NEUROLAB_WEIGHT_MATRIX_HPP

//! \file WeightMatrix.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/multi_array.hpp>

#include <neurolab/config.h>
#include <neurolab/Pattern.hpp>

namespace neurolab {

/*! \brief Dense square matrix of synaptic weights
 *
 * Row \a i holds the incoming weights of neuron \a i.
 */
class NEUROLAB_DLL_PUBLIC WeightMatrix
{
	public :

		typedef boost::multi_array<double, 2> array_type;

		WeightMatrix() : m_w(boost::extents[0][0]) { }

		/*! Create an all-zero matrix of size \a dim x \a dim */
		explicit WeightMatrix(size_t dim) : m_w(boost::extents[dim][dim]) { }

		WeightMatrix(const WeightMatrix& other) : m_w(other.m_w) { }

		/* multi_array assignment requires equal shapes, so resize first */
		WeightMatrix& operator=(const WeightMatrix& other) {
			if(this != &other) {
				m_w.resize(boost::extents[other.dimension()][other.dimension()]);
				m_w = other.m_w;
			}
			return *this;
		}

		size_t dimension() const { return m_w.shape()[0]; }

		double operator()(size_t i, size_t j) const { return m_w[i][j]; }

		double& operator()(size_t i, size_t j) { return m_w[i][j]; }

		/*! \return W[i] . x, summed in index order
		 * \pre x.size() == dimension() */
		double activation(size_t i, const Pattern& x) const;

		const array_type& array() const { return m_w; }

	private :

		array_type m_w;
};

} // end namespace neurolab

#endif
