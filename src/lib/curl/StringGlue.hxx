// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "StringResponse.hxx"

class CurlEasy;

/**
 * Perform the request synchronously and collect the whole response in
 * memory.
 *
 * Throws #Curl::Error on error.  Any HTTP status is considered a
 * success; the caller has to inspect StringCurlResponse::status.
 */
StringCurlResponse
StringCurlRequest(CurlEasy easy);
