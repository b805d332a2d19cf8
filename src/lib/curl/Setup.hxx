// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class CurlEasy;

namespace Curl {

/**
 * Apply the default settings of this project to a new easy handle.
 */
void
Setup(CurlEasy &easy);

} // namespace Curl
