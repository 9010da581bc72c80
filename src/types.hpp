#pragma once
/*
 * Types
 *
 * Purpose: shared lightweight structs/enums (Mode/Cursor/Viewport/VisibleRange).
 * Principle: carry simple state; avoid cross-module coupling/business logic.
 * Note: rows are 0-based, Cursor::col is a byte offset into the line.
 */

enum class Mode { Normal, Insert, Command };

struct Cursor { int row = 0; int col = 0; };
struct Viewport { int top_line = 0; int left_col = 0; };

/* inclusive row range currently on screen */
struct VisibleRange { int first_row = 0; int last_row = -1; };

/* size of one character cell; pixels on graphical hosts, 1x1 on a terminal */
struct CellSize { int width = 1; int height = 1; };
