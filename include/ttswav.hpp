#pragma once

// Umbrella header — includes the whole ttswav pipeline

#include "ttswav/audio_io.hpp"
#include "ttswav/base64.hpp"
#include "ttswav/byte_order.hpp"
#include "ttswav/config.hpp"
#include "ttswav/errors.hpp"
#include "ttswav/format.hpp"
#include "ttswav/mime.hpp"
#include "ttswav/normalize.hpp"
#include "ttswav/pipeline.hpp"
#include "ttswav/resample.hpp"
#include "ttswav/wav.hpp"
