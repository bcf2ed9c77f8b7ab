/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <iostream>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include <boost/format.hpp>

#include "common.hpp"


void
TextRenderer::check(const std::string& title) const
{
	if(!m_out) {
		throw std::runtime_error("output stream not writable while rendering " + title);
	}
}



void
TextRenderer::renderGrid(const neurolab::grid_t& grid, const std::string& title)
{
	using boost::format;

	/* shading from lowest to highest value in the grid */
	static const char ramp[] = " .:-=+*#%@";
	static const unsigned levels = sizeof(ramp) - 2;

	const size_t rows = grid.shape()[0];
	const size_t cols = grid.shape()[1];

	double lo = 0.0;
	double hi = 0.0;
	if(grid.num_elements() != 0) {
		lo = *std::min_element(grid.data(), grid.data() + grid.num_elements());
		hi = *std::max_element(grid.data(), grid.data() + grid.num_elements());
	}

	m_out << "# " << title << " (" << rows << "x" << cols << ")\n";
	for(size_t r=0; r < rows; ++r) {
		m_out << "  ";
		for(size_t c=0; c < cols; ++c) {
			unsigned level = hi > lo ? unsigned((grid[r][c] - lo) / (hi - lo) * levels + 0.5) : levels;
			m_out << ramp[level] << ramp[level];
		}
		m_out << "   ";
		for(size_t c=0; c < cols; ++c) {
			m_out << format(" %5.2f") % grid[r][c];
		}
		m_out << "\n";
	}
	m_out << std::endl;
	check(title);
}



void
TextRenderer::renderSeries(
		const std::vector<double>& x,
		const std::vector<double>& y,
		const std::string& title)
{
	using boost::format;

	if(x.size() != y.size()) {
		throw neurolab::exception(NEUROLAB_LENGTH_MISMATCH,
				str(format("Series %s has %u x values but %u y values")
					% title % x.size() % y.size()));
	}

	m_out << "# " << title << "\n";
	for(size_t i=0; i < x.size(); ++i) {
		m_out << format("%g %g\n") % x[i] % y[i];
	}
	m_out << std::endl;
	check(title);
}



void
ConsoleNotifier::selection(const neurolab::Selection& sel)
{
	switch(sel.kind()) {
		case neurolab::Selection::SINGLE :
			m_out << "Selected stimulus: " << sel << std::endl;
			break;
		case neurolab::Selection::TIED :
			m_out << "Selected stimuli (tied): " << sel << std::endl;
			break;
		case neurolab::Selection::NONE :
			m_out << "No winner: several stimuli share the maximum" << std::endl;
			break;
	}
}



void
ConsoleNotifier::hysteresis(const neurolab::HysteresisDecision& d)
{
	using boost::format;
	if(m_hysteresisEvents) {
		m_out << format("t=%-8g %-6s v=%g\n")
			% d.time
			% (d.mode == neurolab::HysteresisDecision::DRIVEN ? "driven" : "held")
			% d.value;
	}
}



void
renderGrid(neurolab::RenderSink* sink, const neurolab::grid_t& grid, const std::string& title)
{
	if(sink == NULL) {
		return;
	}
	try {
		sink->renderGrid(grid, title);
	} catch(std::exception& e) {
		std::cerr << "Failed to render " << title << ": " << e.what() << std::endl;
	}
}



void
renderSeries(neurolab::RenderSink* sink,
		const std::vector<double>& x,
		const std::vector<double>& y,
		const std::string& title)
{
	if(sink == NULL) {
		return;
	}
	try {
		sink->renderSeries(x, y, title);
	} catch(std::exception& e) {
		std::cerr << "Failed to render " << title << ": " << e.what() << std::endl;
	}
}



neurolab::MembranePotential
membrane(const neurolab::Configuration& conf)
{
	return neurolab::MembranePotential(conf.tau(), conf.restingPotential());
}



neurolab::Configuration
configuration(const boost::program_options::variables_map& opts)
{
	neurolab::Configuration conf;

	if(opts.count("config")) {
		neurolab::loadConfigurationFile(opts["config"].as<std::string>(), conf);
	}

	/* command line takes precedence over the configuration file */
	if(opts["verbose"].as<unsigned>() >= 2) {
		conf.enableLogging();
	}

	if(opts.count("seed")) {
		conf.setSeed(opts["seed"].as<unsigned>());
	}

	if(opts.count("steps")) {
		conf.setRecallSteps(opts["steps"].as<unsigned>());
	}

	if(opts.count("flips")) {
		conf.setNoiseFlipCount(opts["flips"].as<unsigned>());
	}

	if(opts.count("sign-policy")) {
		conf.setSignPolicy(neurolab::parseSignPolicy(opts["sign-policy"].as<std::string>()));
	}

	if(opts.count("tie-tolerance")) {
		conf.setTieTolerance(opts["tie-tolerance"].as<double>());
	}

	return conf;
}



boost::program_options::options_description
commonOptions()
{
	namespace po = boost::program_options;

	po::options_description desc("Allowed options");
	desc.add_options()
		("help,h", "print this message")
		("config,c", po::value<std::string>(), "read model parameters from .ini file")
		("verbose,v", po::value<unsigned>()->default_value(1), "Set verbosity level. 0 is silent, 2 also reports every hysteresis decision")
		("output-file,o", po::value<std::string>(), "output file for rendered grids and series")
		("no-render", "do not render grids and series")
	;

	return desc;
}



boost::program_options::variables_map
processOptions(int argc, char* argv[],
		const boost::program_options::options_description& desc)
{
	namespace po = boost::program_options;

	po::variables_map vm;
	po::store(po::parse_command_line(argc, argv, desc), vm);
	po::notify(vm);

	if(vm.count("help")) {
		std::cout << "Usage:\n\t" << argv[0] << " [OPTIONS]\n\n";
		std::cout << desc << std::endl;
		exit(1);
	}

	return vm;
}
