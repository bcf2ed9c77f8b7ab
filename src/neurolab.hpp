#ifndef NEUROLAB_HPP
#define NEUROLAB_HPP

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <neurolab/Configuration.hpp>
#include <neurolab/exception.hpp>
#include <neurolab/Integrator.hpp>
#include <neurolab/StimulusSelector.hpp>
#include <neurolab/MotorEncoder.hpp>
#include <neurolab/HysteresisGate.hpp>
#include <neurolab/Notification.hpp>
#include <neurolab/HopfieldMemory.hpp>
#include <neurolab/Noise.hpp>
#include <neurolab/Render.hpp>

#endif
