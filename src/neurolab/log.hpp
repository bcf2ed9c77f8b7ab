#ifndef NEUROLAB_LOG_HPP
#define NEUROLAB_LOG_HPP

/* Copyright 2026 The neurolab developers
 *
 * This file is part of neurolab.
 *
 * This software is licenced for non-commercial academic use under the GNU
 * General Public Licence (GPL). You should have received a copy of this
 * licence along with neurolab. If not, see <http://www.gnu.org/licenses/>.
 */

#include <neurolab/config.h>

#ifdef NEUROLAB_DEBUG_TRACE

#include <stdio.h>
#include <stdlib.h>

#define LOG(...) fprintf(stdout, __VA_ARGS__);

#else

#define LOG(...)

#endif

#endif
