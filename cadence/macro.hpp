/*
 * macro.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2026-10-19

Description: Common macros shared by all cadence modules

**************************************************/

#ifndef CADENCE_MACRO_HPP
#define CADENCE_MACRO_HPP

#define CADENCE_FILE_NAME __FILE__
#define CADENCE_FILE_LINE __LINE__
#define CADENCE_FUNC_NAME __func__

#define CADENCE_VERSION_MAJOR 1
#define CADENCE_VERSION_MINOR 0
#define CADENCE_VERSION_PATCH 0

#endif  // CADENCE_MACRO_HPP
