#pragma once

// Umbrella header: segmentation engine, SRT export and recognizer input

#include "subcue/asr_result.hpp"
#include "subcue/charclass.hpp"
#include "subcue/config.hpp"
#include "subcue/segment.hpp"
#include "subcue/srt.hpp"
#include "subcue/subtitler.hpp"
#include "subcue/utf8.hpp"
