/**
 * @file include_as.hpp
 *
 * @brief Helper header for including AngelScript
 */

#ifndef ASBRIDGE_DETAIL_INCLUDE_AS_HPP
#define ASBRIDGE_DETAIL_INCLUDE_AS_HPP

#pragma once

#ifndef ANGELSCRIPT_H
// Skip the include when the embedding application already pulled in its own copy
#    include <angelscript.h> // IWYU pragma: export
#endif

#endif
