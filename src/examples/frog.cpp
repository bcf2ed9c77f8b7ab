/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

/* Visual stimulus selection in the frog tectum
 *
 * Ten stimuli are presented across the visual field. The strongest one is
 * selected, turned into a motor direction, and drives a leaky-integrator
 * membrane. The last scenario gates the response with hysteresis. */

#include <cstdio>
#include <fstream>
#include <iostream>
#include <vector>
#include <boost/scoped_ptr.hpp>
#include <boost/format.hpp>

#include <neurolab.hpp>
#include "common.hpp"

#define LOG(cond, ...) if(cond) { fprintf(stdout, __VA_ARGS__); fprintf(stdout, "\n"); }

#define STIMULUS_COUNT 10

/* rows of the rendered visual field */
#define FIELD_ROWS 10

static const double s_stimuli[4][STIMULUS_COUNT] = {
	{ 0.1, 0.5, 0.8, 0.6, 0.2, 0.7, 0.4, 0.3, 0.9, 0.2 },
	{ 0.1, 0.5, 0.8, 0.9, 0.2, 0.7, 0.4, 0.3, 0.9, 0.2 },
	{ 0.1, 0.5, 0.7, 0.4, 0.9, 0.8, 0.2, 0.9, 0.3, 0.5 },
	{ 0.1, 0.5, 0.73, 0.4, 0.6, 0.44, 0.2, 0.62, 0.3, 0.5 }
};


std::vector<double>
stimuli(unsigned scenario)
{
	return std::vector<double>(s_stimuli[scenario], s_stimuli[scenario] + STIMULUS_COUNT);
}



void
plotMembrane(const neurolab::Configuration& conf,
		double current,
		const std::string& title,
		neurolab::RenderSink* renderer)
{
	neurolab::MembranePotential g = membrane(conf);
	neurolab::Trajectory tr = neurolab::integrate(g,
			conf.initialPotential(), conf.startTime(), conf.endTime(),
			conf.stepSize(), current);
	renderSeries(renderer, tr.times, tr.values, title);
}



/*! Select among the stimuli, report the motor direction and integrate the
 * membrane driven by the winning intensity */
void
selectAndMove(unsigned scenario,
		const neurolab::Configuration& conf,
		tie_policy_t policy,
		neurolab::NotificationSink* notifier,
		neurolab::RenderSink* renderer,
		unsigned verbose)
{
	using boost::format;

	std::vector<double> s = stimuli(scenario);
	std::string label = str(format("simulation %u") % (scenario+1));

	renderGrid(renderer, neurolab::tile(s, FIELD_ROWS), label + ": stimuli");

	neurolab::StimulusSelector selector(policy, conf.tieTolerance());
	neurolab::Selection sel = selector.select(s, notifier);

	if(sel.empty()) {
		LOG(verbose, "%s: no selection, the frog stays still", label.c_str());
	} else {
		double dir = neurolab::direction(sel, s.size());
		LOG(verbose, "%s: motor direction %g", label.c_str(), dir);
	}

	double current = neurolab::maxStimulus(s) * conf.inputGain();
	plotMembrane(conf, current, label + ": membrane potential", renderer);
}



/*! One-shot hysteresis on the stimulus intensities followed by the
 * per-step gated membrane */
void
gatedResponse(const neurolab::Configuration& conf,
		double previous,
		neurolab::NotificationSink* notifier,
		neurolab::RenderSink* renderer,
		unsigned verbose)
{
	std::vector<double> s = stimuli(3);
	const double threshold = conf.hysteresisThreshold();

	renderGrid(renderer, neurolab::tile(s, FIELD_ROWS), "simulation 4: stimuli");

	double response = neurolab::hysteresis(s, previous, threshold, notifier);
	LOG(verbose, "simulation 4: maximum %g, threshold %g, response %g",
			neurolab::maxStimulus(s), threshold, response);

	std::vector<double> masked(s);
	for(std::vector<double>::iterator i = masked.begin(); i != masked.end(); ++i) {
		if(*i <= threshold) {
			*i = 0.0;
		}
	}
	renderGrid(renderer, neurolab::tile(masked, FIELD_ROWS), "simulation 4: stimuli above threshold");

	neurolab::MembranePotential g = membrane(conf);
	const double retained = conf.restingPotential();
	neurolab::Trajectory tr = neurolab::integrateWithHysteresis(g,
			retained, conf.startTime(), conf.endTime(), conf.stepSize(),
			s, conf.inputGain(), conf.streamingThreshold(), retained, notifier);
	renderSeries(renderer, tr.times, tr.values, "simulation 4: gated membrane potential");
}



int
main(int argc, char* argv[])
{
	namespace po = boost::program_options;

	try {

		po::options_description desc = commonOptions();
		desc.add_options()
			("simulation,s", po::value<unsigned>()->default_value(0), "run only the given scenario (1-4), 0 runs all")
			("previous,p", po::value<double>()->default_value(0.7), "previous response retained by the hysteresis scenario")
			("tie-tolerance", po::value<double>(), "intensities within this distance of the maximum count as tied")
		;

		po::variables_map vm = processOptions(argc, argv, desc);

		unsigned scenario = vm["simulation"].as<unsigned>();
		unsigned verbose = vm["verbose"].as<unsigned>();
		double previous = vm["previous"].as<double>();

		if(scenario > 4) {
			std::cerr << "frog: scenario must be between 0 and 4\n";
			return -1;
		}

		std::ofstream file;
		std::string filename;

		if(vm.count("output-file")) {
			filename = vm["output-file"].as<std::string>();
			file.open(filename.c_str()); // closes on destructor
		}

		std::ostream& out = filename.empty() ? std::cout : file;

		LOG(verbose, "Creating configuration");
		neurolab::Configuration conf = configuration(vm);
		if(verbose >= 2) {
			std::cout << conf << std::endl;
		}

		boost::scoped_ptr<TextRenderer> renderer;
		if(!vm.count("no-render")) {
			renderer.reset(new TextRenderer(out));
		}

		boost::scoped_ptr<ConsoleNotifier> notifier;
		if(verbose) {
			notifier.reset(new ConsoleNotifier(std::cout, conf.loggingEnabled()));
		}

		if(scenario == 0 || scenario == 1) {
			selectAndMove(0, conf, NEUROLAB_ALLOW_TIES, notifier.get(), renderer.get(), verbose);
		}
		if(scenario == 0 || scenario == 2) {
			selectAndMove(1, conf, NEUROLAB_ALLOW_TIES, notifier.get(), renderer.get(), verbose);
		}
		if(scenario == 0 || scenario == 3) {
			selectAndMove(2, conf, NEUROLAB_REJECT_TIES, notifier.get(), renderer.get(), verbose);
		}
		if(scenario == 0 || scenario == 4) {
			gatedResponse(conf, previous, notifier.get(), renderer.get(), verbose);
		}

		LOG(verbose, "Simulation complete");
		return 0;
	} catch(std::exception& e) {
		std::cerr << e.what() << std::endl;
		return -1;
	} catch(...) {
		std::cerr << "frog: An unknown error occurred\n";
		return -1;
	}
}
