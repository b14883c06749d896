#pragma once

/*
===============================================================================
chunkwire — Public API Entry Point
===============================================================================

Byte-budgeted streaming of array-heavy surface updates.

  core::Value / core::canonical   dynamic values and their canonical text
  schema::Envelope / ChunkMessage  wire-level message shapes
  codec::plan                      per-array segmentation
  codec::Emitter / codec::emit     envelope -> ordered chunk stream
  codec::Reassembler               chunk stream -> envelope
  parser::*                        simdjson DOM -> typed messages
===============================================================================
*/

#include "chunkwire/core/value.hpp"
#include "chunkwire/core/canonical.hpp"
#include "chunkwire/schema/envelope.hpp"
#include "chunkwire/schema/chunk_message.hpp"
#include "chunkwire/codec/error.hpp"
#include "chunkwire/codec/document.hpp"
#include "chunkwire/codec/segmenter.hpp"
#include "chunkwire/codec/sink.hpp"
#include "chunkwire/codec/emitter.hpp"
#include "chunkwire/codec/reassembler.hpp"
#include "chunkwire/parser/envelope.hpp"
#include "chunkwire/parser/chunk_message.hpp"
