#ifndef NEUROLAB_EXAMPLES_COMMON_HPP
#define NEUROLAB_EXAMPLES_COMMON_HPP

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <ostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>

#include <neurolab.hpp>


/*! Writes grids and series as plain text
 *
 * Grids are written as a shaded character map followed by the raw values,
 * series as two whitespace-separated columns suitable for gnuplot. */
class TextRenderer : public neurolab::RenderSink
{
	public :

		explicit TextRenderer(std::ostream& out) : m_out(out) { }

		void renderGrid(const neurolab::grid_t& grid, const std::string& title);

		void renderSeries(
				const std::vector<double>& x,
				const std::vector<double>& y,
				const std::string& title);

	private :

		std::ostream& m_out;

		void check(const std::string& title) const;
};


/*! Reports selection events, and optionally every hysteresis decision */
class ConsoleNotifier : public neurolab::NotificationSink
{
	public :

		ConsoleNotifier(std::ostream& out, bool hysteresisEvents) :
			m_out(out), m_hysteresisEvents(hysteresisEvents) { }

		void selection(const neurolab::Selection&);

		void hysteresis(const neurolab::HysteresisDecision&);

	private :

		std::ostream& m_out;
		bool m_hysteresisEvents;
};


/* Rendering failures are reported on stderr and otherwise ignored, since
 * they do not affect any computed result */
void
renderGrid(neurolab::RenderSink* sink, const neurolab::grid_t& grid, const std::string& title);

void
renderSeries(neurolab::RenderSink* sink,
		const std::vector<double>& x,
		const std::vector<double>& y,
		const std::string& title);


neurolab::MembranePotential
membrane(const neurolab::Configuration& conf);


neurolab::Configuration
configuration(const boost::program_options::variables_map& opts);


boost::program_options::options_description
commonOptions();


boost::program_options::variables_map
processOptions(int argc, char* argv[],
		const boost::program_options::options_description& desc);

#endif
