#pragma once
#include "packgraph/core/interfaces/iswap.hpp"
#include <functional>
#include <memory>
#include <utility>

namespace packgraph {

    /**
     * @class FunctionSwap
     * @brief IObjectSwap built from a pair of callables.
     */
    class FunctionSwap : public IObjectSwap {
    public:
        using Forward = std::function<Value(const Value&)>;
        using Reverse = std::function<Value(Value, const TypeDescriptor&)>;

        FunctionSwap(TypeRef swapType, Forward fwd, Reverse rev)
            : swapType_(std::move(swapType)), fwd_(std::move(fwd)), rev_(std::move(rev)) {}

        TypeRef swapType() const override { return swapType_; }
        Value swap(const Value& value) const override { return fwd_(value); }
        Value unswap(Value value, const TypeDescriptor& declared) const override {
            return rev_(std::move(value), declared);
        }

    private:
        TypeRef swapType_;
        Forward fwd_;
        Reverse rev_;
    };

    /**
     * @class FunctionBuilderSwap
     * @brief IBuilderSwap whose builder is a plain record of builderType().
     */
    class FunctionBuilderSwap : public IBuilderSwap {
    public:
        using Finish = std::function<Value(RecordPtr, const TypeDescriptor&)>;

        FunctionBuilderSwap(TypeRef builderType, Finish finish)
            : builderType_(std::move(builderType)), finish_(std::move(finish)) {}

        TypeRef builderType() const override { return builderType_; }
        RecordPtr newBuilder(const TypeDescriptor&) const override {
            return std::make_shared<Record>(builderType_);
        }
        Value build(RecordPtr builder, const TypeDescriptor& declared) const override {
            return finish_(std::move(builder), declared);
        }

    private:
        TypeRef builderType_;
        Finish finish_;
    };

}
