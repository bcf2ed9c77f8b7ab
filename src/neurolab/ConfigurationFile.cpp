/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/program_options.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/format.hpp>

#include "Configuration.hpp"
#include "exception.hpp"
#include "log.hpp"

namespace neurolab {


template<typename T>
T
getOr(const boost::program_options::variables_map& vm,
		const std::string& name, T fallback)
{
	return vm.count(name) ? vm[name].as<T>() : fallback;
}



void
applyOptions(const boost::program_options::variables_map& vm, Configuration& conf)
{
	if(vm.count("logging")) {
		if(vm["logging"].as<bool>()) {
			conf.enableLogging();
		} else {
			conf.disableLogging();
		}
	}

	if(vm.count("tau") || vm.count("v-rest")) {
		conf.setMembrane(
				getOr<double>(vm, "tau", conf.tau()),
				getOr<double>(vm, "v-rest", conf.restingPotential()));
	}

	if(vm.count("initial-potential")) {
		conf.setInitialPotential(vm["initial-potential"].as<double>());
	}

	if(vm.count("step-size")) {
		conf.setStepSize(vm["step-size"].as<double>());
	}

	if(vm.count("t-start") || vm.count("t-end")) {
		conf.setSimulationTime(
				getOr<double>(vm, "t-start", conf.startTime()),
				getOr<double>(vm, "t-end", conf.endTime()));
	}

	if(vm.count("input-gain")) {
		conf.setInputGain(vm["input-gain"].as<double>());
	}

	if(vm.count("tie-tolerance")) {
		conf.setTieTolerance(vm["tie-tolerance"].as<double>());
	}

	if(vm.count("threshold")) {
		conf.setHysteresisThreshold(vm["threshold"].as<double>());
	}

	if(vm.count("streaming-threshold")) {
		conf.setStreamingThreshold(vm["streaming-threshold"].as<double>());
	}

	if(vm.count("normalization-factor")) {
		conf.setNormalizationFactor(vm["normalization-factor"].as<double>());
	}

	if(vm.count("recall-steps")) {
		conf.setRecallSteps(vm["recall-steps"].as<unsigned>());
	}

	if(vm.count("noise-flip-count")) {
		conf.setNoiseFlipCount(vm["noise-flip-count"].as<unsigned>());
	}

	if(vm.count("sign-policy")) {
		conf.setSignPolicy(parseSignPolicy(vm["sign-policy"].as<std::string>()));
	}

	if(vm.count("seed")) {
		conf.setSeed(vm["seed"].as<unsigned>());
	}
}



void
loadConfigurationFile(const std::string& name, Configuration& conf)
{
	using boost::format;
	namespace po = boost::program_options;
	namespace fs = boost::filesystem;

	po::options_description desc("Allowed options");
	desc.add_options()
		/* membrane and integration */
		("tau", po::value<double>(), "membrane time constant")
		("v-rest", po::value<double>(), "resting potential")
		("initial-potential", po::value<double>(), "membrane potential at start of run")
		("step-size", po::value<double>(), "integration step size")
		("t-start", po::value<double>(), "simulation start time")
		("t-end", po::value<double>(), "simulation end time")
		("input-gain", po::value<double>(), "stimulus to input current conversion factor")
		/* selection and hysteresis */
		("tie-tolerance", po::value<double>(), "maximum distance from the maximum for a tie")
		("threshold", po::value<double>(), "one-shot hysteresis threshold")
		("streaming-threshold", po::value<double>(), "per-step hysteresis threshold")
		/* hopfield */
		("normalization-factor", po::value<double>(), "weight matrix scaling")
		("recall-steps", po::value<unsigned>(), "maximum number of recall sweeps")
		("noise-flip-count", po::value<unsigned>(), "number of entries flipped by noise")
		("sign-policy", po::value<std::string>(), "zero activation policy: keep, positive or reject")
		("seed", po::value<unsigned>(), "noise generator seed")
		("logging", po::value<bool>(), "report selection and hysteresis events")
	;

	fs::path filename(name);
	if(!fs::exists(filename)) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Could not find configuration file %s") % filename));
	}

	fs::ifstream file(filename);
	if(!file) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Could not open configuration file %s") % filename));
	}

	LOG("loading configuration from %s\n", name.c_str());

	try {
		po::variables_map vm;
		po::store(po::parse_config_file(file, desc), vm);
		po::notify(vm);
		/* a file with any invalid setting leaves conf untouched */
		Configuration loaded(conf);
		applyOptions(vm, loaded);
		conf.swap(loaded);
	} catch (po::error& e) {
		throw neurolab::exception(NEUROLAB_INVALID_INPUT,
				str(format("Error parsing configuration file %s: %s")
					% filename % e.what()));
	}
}

} // end namespace neurolab
