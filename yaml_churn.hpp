/**
 * @file yaml_churn.hpp
 * @brief A streaming YAML 1.2 parser for C++23.
 *
 * This header-only library provides:
 *   - A Scanner turning UTF-8 text into tokens, with block indentation, simple keys,
 *     flow collections, all five scalar styles and the full escape set
 *   - A Parser (explicit-stack pushdown automaton) producing structural Events,
 *     usable pull-style (`Next()`, `Peek()`) or push-style (`Parse(receiver)`)
 *   - Tag resolution through `%TAG` directives and the `!`/`!!` handles
 *   - Per-document anchors resolved to numeric ids, with undefined aliases rejected
 *   - A Loader building an arena-backed tree where aliases share nodes (cycles allowed),
 *     with a selectable duplicate-key policy
 *   - Input from strings, byte buffers (UTF-8/UTF-16 detection), iterators and streams
 *   - Source positions (byte, line, column) on every token, event, node and error
 *   - A minimal block-style Emitter whose output loads back to an equal tree
 *
 * Usage Example:
 * @code
 * #include "yaml_churn.hpp"
 * Churn::Stream docs = Churn::LoadFile("test.yml");
 * std::string host = docs[0]["server1"]["host"].AsString();
 *
 * Churn::Parser parser = Churn::Parser::FromString("[1, 2, 3]");
 * while (!parser.Done()) {
 *     Churn::Event e = parser.Next();
 *     // ...
 * }
 * @endcode
 *
 * @author Greg M. Krsak <greg.krsak@gmail.com>
 * @date October 17, 2026
 * @copyright MIT License
 */

#ifndef YAML_CHURN_HPP
#define YAML_CHURN_HPP

#include "yaml_churn/log.hpp"
#include "yaml_churn/marker.hpp"
#include "yaml_churn/error.hpp"
#include "yaml_churn/text.hpp"
#include "yaml_churn/chars.hpp"
#include "yaml_churn/input.hpp"
#include "yaml_churn/token.hpp"
#include "yaml_churn/scanner.hpp"
#include "yaml_churn/event.hpp"
#include "yaml_churn/parser.hpp"
#include "yaml_churn/node.hpp"
#include "yaml_churn/loader.hpp"
#include "yaml_churn/emitter.hpp"

#endif // YAML_CHURN_HPP
