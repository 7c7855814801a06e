#pragma once

/** \file converge.hpp
 *  \brief Umbrella header for the converge library.
 */

#include "converge/error.hpp"
#include "converge/outcome.hpp"
#include "converge/ensurable.hpp"
#include "converge/ensure.hpp"
#include "converge/fs/path_ensurers.hpp"
