/**
 * @file babylonify.h
 * @brief Language filtering for Parquet transcription datasets.
 *
 * Rows of a Parquet file are kept when the language detected in a designated
 * text column matches a target language. Files are streamed batch by batch,
 * rows are classified in parallel, and output preserves row order and schema.
 */

#pragma once

#define BABYLONIFY_VERSION_MAJOR 0
#define BABYLONIFY_VERSION_MINOR 1
#define BABYLONIFY_VERSION_PATCH 0
#define BABYLONIFY_VERSION_STRING "0.1.0"

#include "babylonify/batch_pipeline.h"
#include "babylonify/debug.h"
#include "babylonify/detector.h"
#include "babylonify/directory_runner.h"
#include "babylonify/error.h"
#include "babylonify/language.h"
#include "babylonify/parquet_io.h"
#include "babylonify/row_classifier.h"
#include "babylonify/text_cleaner.h"
#include "babylonify/utf8.h"
