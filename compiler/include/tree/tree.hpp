//! # Program Tree
//!
//! The resolved program representation consumed by the backend. Include
//! this header to get every node type.
//!
//! ## Files
//!
//! | Header              | Contents                                  |
//! |---------------------|-------------------------------------------|
//! | `tree_pattern.hpp`  | Match-arm patterns                        |
//! | `tree_expr.hpp`     | Expressions and statements                |
//! | `tree_decl.hpp`     | Types, variants, methods, functions       |
//! | `tree_module.hpp`   | Fragments, module units, lowered modules  |
//! | `tree_walk.hpp`     | Traversal, cloning and type rewriting     |

#pragma once

#include "tree/tree_decl.hpp"
#include "tree/tree_expr.hpp"
#include "tree/tree_module.hpp"
#include "tree/tree_pattern.hpp"
#include "tree/tree_walk.hpp"
