/**
 * @file error_types.hpp
 * @brief Error type definitions for packgraph.
 *
 * Provides the error code enum, the structured failure record and the exception
 * hierarchy raised while decoding a MessagePack stream into a value graph.
 *
 * @author Efecan
 * @date 2025
 */
#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>

namespace packgraph {

    /**
     * @enum DecodeErr
     * @brief Error codes for decode operations.
     *
     * - MalformedStream: Unrecognized tag byte pattern
     * - TruncatedStream: Stream ended before a declared payload was read
     * - TypeMismatch: Wire kind incompatible with the requested target
     * - ScalarConversion: Scalar could not be converted to the target type
     * - Construction: Resolver could not instantiate the target type
     * - FieldAssignment: A record field rejected the decoded value
     * - DepthExceeded: Nesting deeper than the configured limit
     * - Io: Underlying byte source failed
     */
    enum class DecodeErr : int {
        MalformedStream = 1,  ///< Unrecognized tag byte pattern
        TruncatedStream,      ///< Stream ended early
        TypeMismatch,         ///< Wire kind vs. target classification mismatch
        ScalarConversion,     ///< Scalar conversion failure
        Construction,         ///< Target could not be instantiated
        FieldAssignment,      ///< Field rejected the value
        DepthExceeded,        ///< Nesting limit reached
        Io = 99               ///< Byte source failure
    };

    /**
     * @brief Human readable name of a DecodeErr value.
     */
    inline const char* toString(DecodeErr e) {
        switch (e) {
        case DecodeErr::MalformedStream:  return "MalformedStream";
        case DecodeErr::TruncatedStream:  return "TruncatedStream";
        case DecodeErr::TypeMismatch:     return "TypeMismatch";
        case DecodeErr::ScalarConversion: return "ScalarConversion";
        case DecodeErr::Construction:     return "Construction";
        case DecodeErr::FieldAssignment:  return "FieldAssignment";
        case DecodeErr::DepthExceeded:    return "DepthExceeded";
        case DecodeErr::Io:               return "Io";
        }
        return "Unknown";
    }

    /**
     * @struct DecodeFailure
     * @brief Structured description of a failed decode.
     */
    struct DecodeFailure {
        DecodeErr   code{ DecodeErr::MalformedStream }; ///< Error code
        std::string msg;                                ///< Error message
        std::string path;                               ///< Field path being decoded, e.g. "$.items[2]"
        std::string targetType;                         ///< Nominal target type at the failure point
        uint64_t    offset{ 0 };                        ///< Approximate byte offset in the stream
    };

    /**
     * @class DecodeError
     * @brief Base exception for every fatal decode failure.
     *
     * The context fields (path, target type, offset) start empty and are filled
     * in by the decoder as the exception passes through it.
     */
    class DecodeError : public std::runtime_error {
    public:
        DecodeError(DecodeErr code, const std::string& msg)
            : std::runtime_error(msg) {
            failure_.code = code;
            failure_.msg = msg;
        }

        DecodeErr code() const { return failure_.code; }
        const DecodeFailure& failure() const { return failure_; }

        /**
         * @brief Attach decode context unless a deeper frame already did.
         * @param path Field path of the failing node
         * @param targetType Nominal target type name
         * @param offset Byte offset of the failing tag
         */
        void attachContext(const std::string& path, const std::string& targetType, uint64_t offset) {
            if (contextAttached_) return;
            contextAttached_ = true;
            failure_.path = path;
            failure_.targetType = targetType;
            failure_.offset = offset;
        }

        bool hasContext() const { return contextAttached_; }

    private:
        DecodeFailure failure_;
        bool contextAttached_{ false };
    };

    class MalformedStreamError : public DecodeError {
    public:
        explicit MalformedStreamError(const std::string& msg) : DecodeError(DecodeErr::MalformedStream, msg) {}
    };

    class TruncatedStreamError : public DecodeError {
    public:
        explicit TruncatedStreamError(const std::string& msg) : DecodeError(DecodeErr::TruncatedStream, msg) {}
    };

    class TypeMismatchError : public DecodeError {
    public:
        explicit TypeMismatchError(const std::string& msg) : DecodeError(DecodeErr::TypeMismatch, msg) {}
    };

    class ScalarConversionError : public DecodeError {
    public:
        explicit ScalarConversionError(const std::string& msg) : DecodeError(DecodeErr::ScalarConversion, msg) {}
    };

    class ConstructionError : public DecodeError {
    public:
        explicit ConstructionError(const std::string& msg) : DecodeError(DecodeErr::Construction, msg) {}
    };

    class FieldAssignmentError : public DecodeError {
    public:
        explicit FieldAssignmentError(const std::string& msg) : DecodeError(DecodeErr::FieldAssignment, msg) {}
    };

    class DepthExceededError : public DecodeError {
    public:
        explicit DepthExceededError(const std::string& msg) : DecodeError(DecodeErr::DepthExceeded, msg) {}
    };

    class IoError : public DecodeError {
    public:
        explicit IoError(const std::string& msg) : DecodeError(DecodeErr::Io, msg) {}
    };

}
