#pragma once

#include "core/memory_store.h"
#include "ind/candle.h"
#include "opt/pipeline.h"
#include "opt/signals.h"

#include <string>
#include <vector>

// Binary (cereal) snapshot of every store table.
void write_store(const std::string& filename, const StoreTables& tables);
StoreTables read_store(const std::string& filename);

// JSON array of {timestamp, open, high, low, close, volume}.
std::vector<Candle> read_candles_json(const std::string& filename);
std::vector<Candle> parse_candles_json(const std::string& str);

std::string summary_to_json(const RunSummary& summary);
void write_summary_json(const std::string& filename,
                        const RunSummary& summary);
void write_signals_json(const std::string& filename,
                        const std::vector<Signal>& signals);
