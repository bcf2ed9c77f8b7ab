/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <algorithm>

#include "Configuration.hpp"
#include "ConfigurationImpl.hpp"

namespace neurolab {

Configuration::Configuration() :
	m_impl(new ConfigurationImpl())
{
	;
}



Configuration::Configuration(const Configuration& other) :
	m_impl(new ConfigurationImpl(*other.m_impl))
{
	;
}



Configuration::~Configuration()
{
	delete m_impl;
}



void
Configuration::swap(Configuration& other)
{
	std::swap(m_impl, other.m_impl);
}


void
Configuration::enableLogging()
{
	m_impl->enableLogging();
}


void
Configuration::disableLogging()
{
	m_impl->disableLogging();
}


bool
Configuration::loggingEnabled() const
{
	return m_impl->loggingEnabled();
}



void
Configuration::setMembrane(double tau, double vRest)
{
	m_impl->setMembrane(tau, vRest);
}


double
Configuration::tau() const
{
	return m_impl->tau();
}


double
Configuration::restingPotential() const
{
	return m_impl->restingPotential();
}


void
Configuration::setInitialPotential(double v)
{
	m_impl->setInitialPotential(v);
}


double
Configuration::initialPotential() const
{
	return m_impl->initialPotential();
}



void
Configuration::setStepSize(double dt)
{
	m_impl->setStepSize(dt);
}


double
Configuration::stepSize() const
{
	return m_impl->stepSize();
}


void
Configuration::setSimulationTime(double tStart, double tEnd)
{
	m_impl->setSimulationTime(tStart, tEnd);
}


double
Configuration::startTime() const
{
	return m_impl->startTime();
}


double
Configuration::endTime() const
{
	return m_impl->endTime();
}


void
Configuration::setInputGain(double gain)
{
	m_impl->setInputGain(gain);
}


double
Configuration::inputGain() const
{
	return m_impl->inputGain();
}



void
Configuration::setTieTolerance(double tolerance)
{
	m_impl->setTieTolerance(tolerance);
}


double
Configuration::tieTolerance() const
{
	return m_impl->tieTolerance();
}


void
Configuration::setHysteresisThreshold(double threshold)
{
	m_impl->setHysteresisThreshold(threshold);
}


double
Configuration::hysteresisThreshold() const
{
	return m_impl->hysteresisThreshold();
}


void
Configuration::setStreamingThreshold(double threshold)
{
	m_impl->setStreamingThreshold(threshold);
}


double
Configuration::streamingThreshold() const
{
	return m_impl->streamingThreshold();
}



void
Configuration::setNormalizationFactor(double factor)
{
	m_impl->setNormalizationFactor(factor);
}


double
Configuration::normalizationFactor() const
{
	return m_impl->normalizationFactor();
}


void
Configuration::setRecallSteps(unsigned steps)
{
	m_impl->setRecallSteps(steps);
}


unsigned
Configuration::recallSteps() const
{
	return m_impl->recallSteps();
}


void
Configuration::setNoiseFlipCount(unsigned flips)
{
	m_impl->setNoiseFlipCount(flips);
}


bool
Configuration::noiseFlipCountSet() const
{
	return m_impl->noiseFlipCountSet();
}


unsigned
Configuration::noiseFlipCount() const
{
	return m_impl->noiseFlipCount();
}


void
Configuration::setSignPolicy(sign_policy_t policy)
{
	m_impl->setSignPolicy(policy);
}


sign_policy_t
Configuration::signPolicy() const
{
	return m_impl->signPolicy();
}


void
Configuration::setSeed(unsigned seed)
{
	m_impl->setSeed(seed);
}


unsigned
Configuration::seed() const
{
	return m_impl->seed();
}

} // end namespace neurolab


std::ostream& operator<<(std::ostream& o, neurolab::Configuration const& conf)
{
	return o << *conf.m_impl;
}
