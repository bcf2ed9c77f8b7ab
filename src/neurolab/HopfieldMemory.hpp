#ifndef NEUROLAB_HOPFIELD_MEMORY_HPP
#define NEUROLAB_HOPFIELD_MEMORY_HPP

//! \file HopfieldMemory.hpp

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <vector>

#include <neurolab/config.h>
#include <neurolab/types.h>
#include <neurolab/Pattern.hpp>
#include <neurolab/WeightMatrix.hpp>

namespace neurolab {


/*! Train a Hopfield weight matrix with the Hebbian rule
 *
 * W is the sum of the outer products p p' over all patterns, divided by the
 * pattern length L. The diagonal is then set to zero and every entry scaled
 * by \a normalization. The result is symmetric.
 *
 * \throws neurolab::exception (NEUROLAB_LENGTH_MISMATCH) if the batch is
 * 		empty, a pattern is empty, or the patterns differ in length.
 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if a pattern is not
 * 		bipolar or \a normalization is not finite.
 */
NEUROLAB_DLL_PUBLIC
WeightMatrix
train(const std::vector<Pattern>& patterns, double normalization);


/*! Perform a single asynchronous sweep in place
 *
 * Neurons are updated in index order, x[i] = sign(W[i] . x), where \a x
 * already contains the updates made earlier in the same sweep. An exactly
 * zero activation is resolved according to \a policy.
 *
 * \return number of neurons which changed value
 *
 * \throws neurolab::exception (NEUROLAB_DEGENERATE_SIGN_STATE) for a zero
 * 		activation under NEUROLAB_SIGN_REJECT. \a x is then partially updated.
 */
NEUROLAB_DLL_PUBLIC
unsigned
sweep(Pattern& x, const WeightMatrix& W, sign_policy_t policy = NEUROLAB_SIGN_KEEP);


/*! Outcome of a recall with convergence information */
struct NEUROLAB_DLL_PUBLIC RecallResult
{
	RecallResult() : sweeps(0), converged(false) { }

	Pattern state;

	/*! Number of sweeps which changed the state before it became stable. If
	 * the state never became stable this is the number of sweeps performed. */
	unsigned sweeps;

	/*! Did a sweep leave the state unchanged within the sweep budget? */
	bool converged;
};


/*! Recall a pattern by asynchronous relaxation from \a query
 *
 * At most \a steps sweeps are performed. Once a sweep leaves the state
 * unchanged every further sweep would too, so relaxation stops there.
 *
 * \throws neurolab::exception (NEUROLAB_LENGTH_MISMATCH) if the query length
 * 		differs from the matrix dimension or is zero
 * \throws neurolab::exception (NEUROLAB_INVALID_INPUT) if the query is not
 * 		bipolar
 * \throws neurolab::exception (NEUROLAB_DEGENERATE_SIGN_STATE) as \a sweep
 */
NEUROLAB_DLL_PUBLIC
RecallResult
recallDetailed(const Pattern& query, const WeightMatrix& W, unsigned steps,
		sign_policy_t policy = NEUROLAB_SIGN_KEEP);


/*! \return recovered pattern, \see recallDetailed */
NEUROLAB_DLL_PUBLIC
Pattern
recall(const Pattern& query, const WeightMatrix& W, unsigned steps,
		sign_policy_t policy = NEUROLAB_SIGN_KEEP);


/*! \return Hopfield energy -1/2 x' W x
 * \throws neurolab::exception (NEUROLAB_LENGTH_MISMATCH) on dimension mismatch */
NEUROLAB_DLL_PUBLIC
double
energy(const Pattern& x, const WeightMatrix& W);



/*! \brief Associative memory over a fixed batch of bipolar patterns
 *
 * The weight matrix is trained once on construction and is read-only
 * afterwards, so a single memory can serve any number of recalls.
 */
class NEUROLAB_DLL_PUBLIC HopfieldMemory
{
	public :

		/*! \copydoc neurolab::train */
		HopfieldMemory(const std::vector<Pattern>& patterns,
				double normalization,
				sign_policy_t policy = NEUROLAB_SIGN_KEEP);

		Pattern recall(const Pattern& query, unsigned steps) const;

		RecallResult recallDetailed(const Pattern& query, unsigned steps) const;

		double energy(const Pattern& x) const;

		const WeightMatrix& weights() const { return m_weights; }

		/*! \return length of the stored patterns */
		size_t dimension() const { return m_weights.dimension(); }

		size_t patternCount() const { return m_patternCount; }

		sign_policy_t signPolicy() const { return m_policy; }

	private :

		WeightMatrix m_weights;

		size_t m_patternCount;

		sign_policy_t m_policy;
};

} // end namespace neurolab

#endif
