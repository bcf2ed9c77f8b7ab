/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

/* Recovery of noisy digits from a Hopfield associative memory
 *
 * Each batch of five digits is stored in its own memory. Every digit is
 * corrupted by flipping a few random pixels and then recalled. */

#include <cstdio>
#include <fstream>
#include <iostream>
#include <vector>
#include <boost/scoped_ptr.hpp>
#include <boost/format.hpp>

#include <neurolab.hpp>
#include "common.hpp"
#include "digits.hpp"

#define LOG(cond, ...) if(cond) { fprintf(stdout, __VA_ARGS__); fprintf(stdout, "\n"); }


/*! \return number of digits in the batch which were not recovered exactly */
unsigned
recoverBatch(const DigitPatterns& digits,
		unsigned flips,
		const neurolab::Configuration& conf,
		neurolab::NoiseSource& noise,
		neurolab::RenderSink* renderer,
		unsigned verbose)
{
	using boost::format;

	neurolab::HopfieldMemory memory(neurolab::patterns(digits),
			conf.normalizationFactor(), conf.signPolicy());

	LOG(verbose, "Stored digits %u-%u in a %u-neuron memory",
			digits.firstDigit(), digits.firstDigit() + unsigned(digits.patternCount()) - 1,
			unsigned(memory.dimension()));

	unsigned failures = 0;

	for(size_t i=0; i < digits.patternCount(); ++i) {

		const neurolab::Pattern& original = digits.pattern(i);
		const std::string name = digits.name(i);

		std::vector<nidx_t> flipped;
		neurolab::Pattern noisy = noise.corrupt(original, flips, &flipped);
		neurolab::RecallResult result = memory.recallDetailed(noisy, conf.recallSteps());

		unsigned distance = neurolab::hammingDistance(result.state, original);
		if(distance != 0) {
			failures += 1;
		}

		if(verbose) {
			std::cout << format("%s: flipped") % name;
			for(std::vector<nidx_t>::const_iterator f = flipped.begin(); f != flipped.end(); ++f) {
				std::cout << " " << *f;
			}
			std::cout << format(", %s after %u sweeps, energy %g -> %g, distance to original %u\n")
				% (result.converged ? "stable" : "not stable")
				% result.sweeps
				% memory.energy(noisy)
				% memory.energy(result.state)
				% distance;
		}

		renderGrid(renderer, neurolab::reshape(original, digits.rows(), digits.columns()), name + ": original");
		renderGrid(renderer, neurolab::reshape(noisy, digits.rows(), digits.columns()), name + ": noisy");
		renderGrid(renderer, neurolab::reshape(result.state, digits.rows(), digits.columns()), name + ": recovered");
	}

	return failures;
}



int
main(int argc, char* argv[])
{
	namespace po = boost::program_options;

	try {

		po::options_description desc = commonOptions();
		desc.add_options()
			("flips,f", po::value<unsigned>(), "number of pixels flipped per digit (default 2 for digits 0-4, 1 for digits 5-9)")
			("seed", po::value<unsigned>(), "seed for the noise generator")
			("steps", po::value<unsigned>(), "maximum number of recall sweeps")
			("sign-policy", po::value<std::string>(), "handling of zero activations: keep, positive or reject")
		;

		po::variables_map vm = processOptions(argc, argv, desc);

		unsigned verbose = vm["verbose"].as<unsigned>();

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

		/* one generator for both batches, so a seed fixes the whole run */
		neurolab::NoiseSource noise(conf.seed());

		unsigned failures = 0;

		DigitPatterns low(0);
		unsigned lowFlips = conf.noiseFlipCountSet() ? conf.noiseFlipCount() : 2;
		failures += recoverBatch(low, lowFlips, conf, noise, renderer.get(), verbose);

		DigitPatterns high(5);
		unsigned highFlips = conf.noiseFlipCountSet() ? conf.noiseFlipCount() : 1;
		failures += recoverBatch(high, highFlips, conf, noise, renderer.get(), verbose);

		LOG(verbose, "%u of 10 digits not recovered exactly", failures);
		return 0;
	} catch(std::exception& e) {
		std::cerr << e.what() << std::endl;
		return -1;
	} catch(...) {
		std::cerr << "hopfield: An unknown error occurred\n";
		return -1;
	}
}
