#pragma once
#include "board-ident/types.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace boardident {
namespace serial {

/// What the USB function on the board is
enum class UsbInterface { VirtualComPort, Dfu, DebugProbe, UsbUart };

struct KnownBoard {
  uint16_t vendor_id;
  uint16_t product_id;
  BoardKind kind;
  UsbInterface interface;
  const char *label;
};

/// The static vendor/product table, in lookup order
const std::vector<KnownBoard> &known_boards();

/// Unmatched or missing ids classify as BoardKind::Unknown
BoardKind classify(std::optional<uint16_t> vendor_id,
                   std::optional<uint16_t> product_id);

/// Full table entry for the pair, if any
std::optional<KnownBoard> lookup_board(std::optional<uint16_t> vendor_id,
                                       std::optional<uint16_t> product_id);

/// True when the pair is a debugger (ST-LINK and friends)
bool is_debug_probe(std::optional<uint16_t> vendor_id,
                    std::optional<uint16_t> product_id);

} // namespace serial
} // namespace boardident
