/*
 * Copyright (C) 2025 Aless Microsystems
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Affero General Public License as published
 * by the Free Software Foundation, version 3 of the License, or under
 * alternative licensing terms as granted by Aless Microsystems.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Affero General Public License for more details.
 */

#pragma once
#include "../../global.h"

#if !defined(BITNUC_DISABLE_NEON_PACK)
#include <cstdint>
#include "pack-result.h"
BITNUC_HOT BITNUC_FLATTEN PackResult neon_pack_2bit(const uint8_t* seq, size_t len);
bool neon_pack_is_native();
#endif
