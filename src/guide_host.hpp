#pragma once
/*
 * IGuideHost
 *
 * Purpose: what the guide controller reads from the editor hosting it.
 * Goal: keep the controller free of terminal/editor types so it can be driven
 *       by a fake host in tests.
 */
#include <optional>
#include "text_buffer.hpp"
#include "types.hpp"

class IGuideHost {
public:
  virtual ~IGuideHost() = default;
  virtual const TextBuffer& buffer() const = 0;
  virtual Cursor cursor() const = 0;
  virtual int tab_width() const = 0;
  virtual VisibleRange visible_range() const = 0;
  /* a command line or other secondary prompt is reading input */
  virtual bool prompt_active() const = 0;
  /* false in contexts where guides are switched off (excluded file types) */
  virtual bool context_eligible() const = 0;
  virtual bool graphical() const = 0;
  virtual CellSize nominal_cell() const = 0;
  /* rendered cell size of a row, nullopt when the row is not fully on screen */
  virtual std::optional<CellSize> row_cell(int row) const = 0;
};
