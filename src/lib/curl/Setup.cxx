// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Setup.hxx"
#include "Easy.hxx"
#include "version.h"

namespace Curl {

void
Setup(CurlEasy &easy)
{
	easy.SetUserAgent(PACKAGE "/" VERSION);
	easy.SetNoProgress();
	easy.SetNoSignal();
}

} // namespace Curl
