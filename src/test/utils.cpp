/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/test/unit_test.hpp>

#include "utils.hpp"


bool
invalidInput(const neurolab::exception& e)
{
	return e.errorNumber() == NEUROLAB_INVALID_INPUT;
}


bool
invalidStepConfig(const neurolab::exception& e)
{
	return e.errorNumber() == NEUROLAB_INVALID_STEP_CONFIG;
}


bool
emptyStimulusSet(const neurolab::exception& e)
{
	return e.errorNumber() == NEUROLAB_EMPTY_STIMULUS_SET;
}


bool
lengthMismatch(const neurolab::exception& e)
{
	return e.errorNumber() == NEUROLAB_LENGTH_MISMATCH;
}


bool
degenerateSignState(const neurolab::exception& e)
{
	return e.errorNumber() == NEUROLAB_DEGENERATE_SIGN_STATE;
}



std::vector<double>
values(const double* data, size_t n)
{
	return std::vector<double>(data, data + n);
}



std::string
writeTemporaryFile(const std::string& contents)
{
	namespace fs = boost::filesystem;

	fs::path name = fs::temp_directory_path() / fs::unique_path("neurolab-%%%%-%%%%.ini");
	fs::ofstream file(name);
	BOOST_REQUIRE(file);
	file << contents;
	return name.string();
}


bool
logicError(const neurolab::exception& e)
{
	return e.errorNumber() == NEUROLAB_LOGIC_ERROR;
}
