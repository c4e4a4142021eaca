#ifndef LSYSTEM_LSYSTEM_HPP
#define LSYSTEM_LSYSTEM_HPP

#include <lsystem/errors.hpp>
#include <lsystem/turtle.hpp>
#include <lsystem/rule_table.hpp>
#include <lsystem/generation.hpp>
#include <lsystem/rewriter.hpp>
#include <lsystem/sequential_rewriter.hpp>
#include <lsystem/chunked_rewriter.hpp>
#include <lsystem/interpreter.hpp>
#include <lsystem/channel.hpp>
#include <lsystem/worker_protocol.hpp>
#include <lsystem/worker.hpp>
#include <lsystem/char_lsystem.hpp>

#endif // LSYSTEM_LSYSTEM_HPP
