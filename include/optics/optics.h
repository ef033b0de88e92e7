// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file optics.h
/// @brief Umbrella header for the optics lens and transform algebra.

#pragma once

#include <optics/optics_config.h>

#include <optics/lens_path.h>
#include <optics/lens_error.h>
#include <optics/concepts.h>
#include <optics/lens.h>
#include <optics/transform.h>
#include <optics/lens_transform.h>
#include <optics/lens_facade.h>
#include <optics/member_lens.h>
#include <optics/index_lens.h>
#include <optics/immer_index_lens.h>
#include <optics/composed_lens.h>
#include <optics/boxed_lens.h>
#include <optics/lens_result.h>
#include <optics/tracing_lens.h>
#include <optics/lager_adapters.h>
