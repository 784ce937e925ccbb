/* Copyright (c) Stanford University, The Regents of the University of California, and others.
 *
 * All Rights Reserved.
 *
 * See Copyright-SimVascular.txt for additional details.
 */

#ifndef TORUS_CORE_EXCEPTION_H
#define TORUS_CORE_EXCEPTION_H

/**
 * @file TorusException.h
 * @brief Exception hierarchy for the torus triangulation library
 *
 * All errors are synchronous and surface to the immediate caller.
 * VertexOrderError is the only type that is expected during normal
 * operation: the orientation search catches it to prune branches.
 */

#include "Types.h"
#include "TorusConfig.h"
#include <cstdlib>
#include <exception>
#include <sstream>
#include <string>
#include <vector>

// Platform-specific includes for stack traces
#if defined(__GNUC__) && !defined(_WIN32)
#include <execinfo.h>
#include <cxxabi.h>
#endif

namespace torus {

// ============================================================================
// Base Exception Class
// ============================================================================

/**
 * @brief Base exception class for all library exceptions
 *
 * Carries a status code, the source location of the throw and, in debug
 * builds, a demangled stack trace.
 */
class TorusException : public std::exception {
public:
    TorusException(const std::string& message,
                   TorusStatus status = TorusStatus::Unknown)
        : message_(message),
          status_(status),
          file_(""),
          line_(0),
          function_("") {
        capture_context();
        build_what();
    }

    TorusException(const std::string& message,
                   const char* file,
                   int line,
                   const char* function = "",
                   TorusStatus status = TorusStatus::Unknown,
                   bool with_stack_trace = true)
        : message_(message),
          status_(status),
          file_(file),
          line_(line),
          function_(function) {
        if (with_stack_trace) {
            capture_context();
        }
        build_what();
    }

    TorusException(const TorusException&) = default;

    virtual ~TorusException() noexcept = default;

    virtual const char* what() const noexcept override {
        return what_.c_str();
    }

    TorusStatus status() const noexcept { return status_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& file() const noexcept { return file_; }
    int line() const noexcept { return line_; }
    const std::string& function() const noexcept { return function_; }
    const std::vector<std::string>& stack_trace() const noexcept { return stack_trace_; }

    /**
     * @brief Prepend caller context to the message
     */
    void add_context(const std::string& context) {
        message_ = context + "\n  -> " + message_;
        build_what();
    }

protected:
    std::string message_;
    TorusStatus status_;
    std::string file_;
    int line_;
    std::string function_;
    std::vector<std::string> stack_trace_;
    std::string what_;

    void capture_context() {
        #if TORUS_DEBUG_MODE
        capture_stack_trace();
        #endif
    }

    void capture_stack_trace() {
        #if defined(__GNUC__) && !defined(_WIN32)
        constexpr int MAX_FRAMES = 32;
        void* frames[MAX_FRAMES];
        int n_frames = backtrace(frames, MAX_FRAMES);

        char** symbols = backtrace_symbols(frames, n_frames);
        if (symbols) {
            if (n_frames > 0) {
                stack_trace_.reserve(static_cast<std::size_t>(n_frames));
            }
            for (int i = 1; i < n_frames; ++i) {  // Skip this function
                std::string symbol(symbols[i]);

                size_t start = symbol.find('(');
                size_t end = symbol.find('+', start);
                if (start != std::string::npos && end != std::string::npos) {
                    std::string mangled = symbol.substr(start + 1, end - start - 1);
                    int status;
                    char* demangled = abi::__cxa_demangle(mangled.c_str(), nullptr, nullptr, &status);
                    if (status == 0 && demangled) {
                        symbol.replace(start + 1, end - start - 1, demangled);
                        std::free(demangled);
                    }
                }

                stack_trace_.push_back(symbol);
            }
            std::free(symbols);
        }
        #endif
    }

    void build_what() {
        std::ostringstream oss;
        oss << "[Torus Exception] " << status_to_string(status_) << "\n";

        if (!file_.empty()) {
            oss << "  Location: " << file_ << ":" << line_;
            if (!function_.empty()) {
                oss << " in " << function_ << "()";
            }
            oss << "\n";
        }

        oss << "  Message: " << message_ << "\n";

        #if TORUS_DEBUG_MODE
        if (!stack_trace_.empty()) {
            oss << "  Stack trace:\n";
            for (size_t i = 0; i < stack_trace_.size() && i < 10; ++i) {
                oss << "    #" << i << " " << stack_trace_[i] << "\n";
            }
        }
        #endif

        what_ = oss.str();
    }
};

// ============================================================================
// Specific Exception Types
// ============================================================================

/**
 * @brief Exception for invalid arguments
 */
class InvalidArgumentException : public TorusException {
public:
    InvalidArgumentException(const std::string& message,
                             const char* file = "",
                             int line = 0,
                             const char* function = "")
        : TorusException(message, file, line, function, TorusStatus::InvalidArgument) {}
};

/**
 * @brief A vertex set was submitted with an order different from the recorded one
 */
class VertexOrderError : public TorusException {
public:
    VertexOrderError(const Simplex& previous,
                     const Simplex& conflicting,
                     const char* file = "",
                     int line = 0,
                     const char* function = "")
        // Raised on every pruned search branch: no stack trace
        : TorusException(build_message(previous, conflicting), file, line, function,
                         TorusStatus::VertexOrder, false),
          previous_(previous),
          conflicting_(conflicting) {}

    const Simplex& previous() const noexcept { return previous_; }
    const Simplex& conflicting() const noexcept { return conflicting_; }

private:
    Simplex previous_;
    Simplex conflicting_;

    static std::string build_message(const Simplex& previous, const Simplex& conflicting) {
        return "Previously-constructed simplex has conflicting vertex order: " +
               to_string(previous) + " != " + to_string(conflicting);
    }
};

/**
 * @brief A vertex lies outside the declared coordinate box
 */
class OutOfBoxException : public TorusException {
public:
    OutOfBoxException(const Vertex& vertex,
                      const std::vector<coord_t>& side_lengths,
                      const char* file = "",
                      int line = 0,
                      const char* function = "")
        : TorusException(build_message(vertex, side_lengths), file, line, function,
                         TorusStatus::OutOfBox),
          vertex_(vertex) {}

    const Vertex& vertex() const noexcept { return vertex_; }

private:
    Vertex vertex_;

    static std::string build_message(const Vertex& vertex, const std::vector<coord_t>& sides) {
        std::ostringstream oss;
        oss << "Vertex " << to_string(vertex) << " outside box [0, " << to_string(Vertex(sides)) << "]";
        return oss.str();
    }
};

/**
 * @brief The group generators do not preserve the set of top-dimensional simplices
 */
class InvalidGroupActionException : public TorusException {
public:
    InvalidGroupActionException(const Simplex& image,
                                const Orbit& orbit,
                                const char* file = "",
                                int line = 0,
                                const char* function = "")
        : TorusException("invalid group action: image " + to_string(image) +
                         " is not a top-dimensional simplex of the complex; orbit = " +
                         to_string(orbit),
                         file, line, function, TorusStatus::InvalidGroupAction),
          image_(image),
          orbit_(orbit) {}

    const Simplex& image() const noexcept { return image_; }
    const Orbit& orbit() const noexcept { return orbit_; }

private:
    Simplex image_;
    Orbit orbit_;
};

/**
 * @brief Discrete boundary identity or quotient vertex order violated
 */
class ConsistencyException : public TorusException {
public:
    ConsistencyException(const std::string& message,
                         const char* file = "",
                         int line = 0,
                         const char* function = "")
        : TorusException(message, file, line, function, TorusStatus::Inconsistent) {}
};

// ============================================================================
// Exception Throwing Macros
// ============================================================================

#define TORUS_THROW(ExceptionType, message) \
    throw ExceptionType(message, __FILE__, __LINE__, __FUNCTION__)

#define TORUS_THROW_IF_3(condition, ExceptionType, message) \
    do { \
        if (TORUS_UNLIKELY(condition)) { \
            TORUS_THROW(ExceptionType, message); \
        } \
    } while(0)

#define TORUS_THROW_IF_2(condition, message) \
    do { \
        if (TORUS_UNLIKELY(condition)) { \
            TORUS_THROW(torus::TorusException, message); \
        } \
    } while(0)

#define TORUS_THROW_IF_SELECT(_1, _2, _3, NAME, ...) NAME

/**
 * @brief Conditional throw with source location
 *
 * Two arguments (condition, message) throw TorusException; three arguments
 * (condition, ExceptionType, message) throw the given type.
 */
#define TORUS_THROW_IF(...) \
    TORUS_THROW_IF_SELECT(__VA_ARGS__, TORUS_THROW_IF_3, TORUS_THROW_IF_2)(__VA_ARGS__)

#define TORUS_CHECK_ARG(condition, message) \
    TORUS_THROW_IF(!(condition), torus::InvalidArgumentException, message)

} // namespace torus

#endif // TORUS_CORE_EXCEPTION_H
