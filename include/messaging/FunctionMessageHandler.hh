/** \file
 *
 * \brief Definition of Trio::Messaging::BasicFunctionMessageHandler class
 */

#ifndef MESSAGING_FUNCTIONMESSAGEHANDLER_HH_
#define MESSAGING_FUNCTIONMESSAGEHANDLER_HH_

#include "messaging/Identity.hh"
#include "messaging/MessageHandler.hh"
#include "messaging/SerializationFailureException.hh"
#include "Blob.hh"

#include <algorithm>
#include <array>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <tuple>
#include <type_traits>
#include <utility>
#include <variant>

namespace Trio {
namespace Messaging {

/** \brief Failed reply to a command
 *
 * \sa Reply
 */
struct ReplyFailure {};

/** \brief Successful reply to a command
 *
 * \tparam Args the types of the values returned to the client
 *
 * \sa Reply
 */
template<typename... Args>
struct ReplySuccess {

    /** \brief Create ReplySuccess from a tuple of values
     */
    explicit ReplySuccess(std::tuple<Args...> arguments) :
        arguments(std::move(arguments))
    {
    }

    /** \brief Convert from a ReplySuccess with compatible values
     *
     * Used for example to convert a reply with \c std::string into a reply
     * with \c std::optional<std::string>.
     */
    template<typename... Args2>
    ReplySuccess(ReplySuccess<Args2...> other) :
        arguments(std::move(other.arguments))
    {
    }

    std::tuple<Args...> arguments;  ///< The values of the reply
};

/** \brief Reply returned by a function wrapped in
 * BasicFunctionMessageHandler
 *
 * \tparam Args the types of the values in a successful reply
 */
template<typename... Args>
struct Reply {

    /** \brief The types of the values in a successful reply
     */
    using Types = std::tuple<Args...>;

    /** \brief Create successful reply
     */
    template<typename... Args2>
    Reply(ReplySuccess<Args2...> reply) : reply {std::move(reply)}
    {
    }

    /** \brief Create failed reply
     */
    Reply(ReplyFailure reply) : reply {std::move(reply)}
    {
    }

    /** \brief The successful or the failed reply
     */
    std::variant<ReplyFailure, ReplySuccess<Args...>> reply;
};

/** \brief Create successful reply
 *
 * \param args the values of the reply
 */
template<typename... Args>
auto success(Args&&... args)
{
    return ReplySuccess<std::decay_t<Args>...> {
        std::tuple<std::decay_t<Args>...> {std::forward<Args>(args)...}};
}

/** \brief Create failed reply
 */
inline auto failure()
{
    return ReplyFailure {};
}

/// \cond DOXYGEN_IGNORE

namespace FunctionMessageHandlerImpl {

template<typename T>
struct ArgTraits {
    using DeserializedType = T;
    static constexpr bool OPTIONAL = false;
    static T&& unwrap(std::optional<T>& arg) { return std::move(*arg); }
};

template<typename T>
struct ArgTraits<std::optional<T>> {
    using DeserializedType = T;
    static constexpr bool OPTIONAL = true;
    static std::optional<T>&& unwrap(std::optional<T>& arg)
    {
        return std::move(arg);
    }
};

template<typename Function, typename ExecutionContext, typename... Args>
decltype(auto) invokeHandlerFunction(
    Function& function, ExecutionContext&& context, const Identity& identity,
    Args&&... args)
{
    if constexpr (
        std::is_invocable_v<
            Function&, ExecutionContext, const Identity&, Args...>) {
        return std::invoke(
            function, std::forward<ExecutionContext>(context), identity,
            std::forward<Args>(args)...);
    } else {
        return std::invoke(function, identity, std::forward<Args>(args)...);
    }
}

template<typename Keys>
auto makeKeys(const Keys& keys)
{
    return std::apply(
        [](const auto&... key)
        {
            return std::array<Blob, sizeof...(key)> {stringToBlob(key)...};
        }, keys);
}

}

/// \endcond

/** \brief Adapt a function into the MessageHandler interface
 *
 * BasicFunctionMessageHandler deserializes the key-value argument frames of a
 * command, calls the wrapped function with them and serializes the values in
 * the returned Reply as key-value reply frames.
 *
 * The function is invoked with the Identity of the sender followed by the
 * deserialized arguments. If the function also accepts the execution context
 * before the identity, the context is passed as well.
 *
 * An argument whose type is \c std::optional<T> may be omitted by the client.
 * All other arguments are required. The command fails with REPLY_FAILURE
 * without calling the function if
 *
 * - a required argument is missing
 * - a key is not followed by a value
 * - a value fails to deserialize
 *
 * Unknown keys are ignored. Empty optional values in a successful reply are
 * left out of the reply.
 *
 * \code{.cc}
 * Reply<std::string> create(
 *     const Identity& identity, std::string name,
 *     std::optional<std::string> mode);
 * \endcode
 *
 * \tparam ExecutionPolicy see \ref executionpolicy
 * \tparam Function the wrapped function
 * \tparam SerializationPolicy a type with \c serialize(value) returning a
 * contiguous byte container and \c deserialize<T>(ByteSpan) throwing
 * SerializationFailureException on failure
 * \tparam Args the types of the arguments after the identity
 *
 * \sa makeMessageHandler()
 */
template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
class BasicFunctionMessageHandler :
    public BasicMessageHandler<ExecutionPolicy> {
public:

    /** \brief Create function message handler
     *
     * \param function the function executing the command
     * \param serializer the serialization policy
     * \param keys tuple containing the keys of the arguments, in the order of
     * \p Args
     * \param replyKeys tuple containing the keys of the reply values, in the
     * order of the Reply returned by \p function
     */
    template<typename Keys, typename ReplyKeys>
    BasicFunctionMessageHandler(
        Function function, SerializationPolicy serializer,
        const Keys& keys, const ReplyKeys& replyKeys);

private:

    using Base = BasicMessageHandler<ExecutionPolicy>;
    using ExecutionContext = typename Base::ExecutionContext;
    using ParameterVector = typename Base::ParameterVector;

    template<typename T>
    using Traits = FunctionMessageHandlerImpl::ArgTraits<std::decay_t<T>>;

    using ResultType = std::remove_cvref_t<
        decltype(
            FunctionMessageHandlerImpl::invokeHandlerFunction(
                std::declval<Function&>(), std::declval<ExecutionContext>(),
                std::declval<const Identity&>(),
                std::declval<std::decay_t<Args>>()...))>;

    static constexpr auto ARGS_SIZE = sizeof...(Args);
    static constexpr auto REPLY_SIZE =
        std::tuple_size_v<typename ResultType::Types>;

    void doHandle(
        ExecutionContext context, const Identity& identity,
        const ParameterVector& params, Response& response) override;

    template<std::size_t... Ns>
    void internalCallFunction(
        ExecutionContext&& context, const Identity& identity,
        const ParameterVector& params, Response& response,
        std::index_sequence<Ns...>);

    template<std::size_t N, typename T>
    bool internalDeserializeArg(
        const std::optional<ByteSpan>& value, std::optional<T>& arg);

    void internalSendReply(const ReplyFailure&, Response& response);

    template<typename... ReplyArgs>
    void internalSendReply(
        const ReplySuccess<ReplyArgs...>& reply, Response& response);

    template<typename T>
    void internalAddReplyValue(
        const Blob& key, const T& value, Response& response);

    template<typename T>
    void internalAddReplyValue(
        const Blob& key, const std::optional<T>& value, Response& response);

    Function function;
    SerializationPolicy serializer;
    std::array<Blob, ARGS_SIZE> argKeys;
    std::array<Blob, REPLY_SIZE> replyKeys;
};

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
template<typename Keys, typename ReplyKeys>
BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::
BasicFunctionMessageHandler(
    Function function, SerializationPolicy serializer, const Keys& keys,
    const ReplyKeys& replyKeys) :
    function(std::move(function)),
    serializer(std::move(serializer)),
    argKeys {FunctionMessageHandlerImpl::makeKeys(keys)},
    replyKeys {FunctionMessageHandlerImpl::makeKeys(replyKeys)}
{
    static_assert(
        ARGS_SIZE == std::tuple_size_v<Keys>,
        "Number of keys must match the number of arguments");
    static_assert(
        REPLY_SIZE == std::tuple_size_v<ReplyKeys>,
        "Number of reply keys must match the number of values in the reply");
}

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
void BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::doHandle(
    ExecutionContext context, const Identity& identity,
    const ParameterVector& params, Response& response)
{
    internalCallFunction(
        std::move(context), identity, params, response,
        std::index_sequence_for<Args...> {});
}

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
template<std::size_t... Ns>
void BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::
internalCallFunction(
    ExecutionContext&& context, const Identity& identity,
    const ParameterVector& params, Response& response,
    std::index_sequence<Ns...>)
{
    if (params.size() % 2 != 0) {
        response.fail();
        return;
    }
    auto values = std::array<std::optional<ByteSpan>, ARGS_SIZE> {};
    for (auto iter = params.begin(); iter != params.end(); iter += 2) {
        const auto key_iter = std::find_if(
            argKeys.begin(), argKeys.end(),
            [&key = iter[0]](const auto& arg_key)
            {
                return asBytes(arg_key) == key;
            });
        if (key_iter != argKeys.end()) {
            values[key_iter - argKeys.begin()] = iter[1];
        }
    }

    [[maybe_unused]] auto args = std::tuple<
        std::optional<typename Traits<Args>::DeserializedType>...> {};
    auto all_valid = false;
    try {
        all_valid = (
            internalDeserializeArg<Ns>(values[Ns], std::get<Ns>(args)) && ...);
    } catch (const SerializationFailureException&) {
        // all_valid stays false
    }
    if (!all_valid) {
        response.fail();
        return;
    }

    auto result = FunctionMessageHandlerImpl::invokeHandlerFunction(
        function, std::move(context), identity,
        Traits<Args>::unwrap(std::get<Ns>(args))...);
    std::visit(
        [this, &response](const auto& reply)
        {
            internalSendReply(reply, response);
        }, result.reply);
}

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
template<std::size_t N, typename T>
bool BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::
internalDeserializeArg(
    const std::optional<ByteSpan>& value, std::optional<T>& arg)
{
    if (!value) {
        return Traits<std::tuple_element_t<N, std::tuple<Args...>>>::OPTIONAL;
    }
    arg.emplace(serializer.template deserialize<T>(*value));
    return true;
}

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
void BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::
internalSendReply(const ReplyFailure&, Response& response)
{
    response.fail();
}

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
template<typename... ReplyArgs>
void BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::
internalSendReply(
    const ReplySuccess<ReplyArgs...>& reply, Response& response)
{
    response.succeed();
    std::apply(
        [this, &response](const auto&... values)
        {
            auto key_iter = replyKeys.begin();
            (internalAddReplyValue(*key_iter++, values, response), ...);
        }, reply.arguments);
}

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
template<typename T>
void BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::
internalAddReplyValue(const Blob& key, const T& value, Response& response)
{
    response.addParameter(
        asBytes(key), asBytes(serializer.serialize(value)));
}

template<
    typename ExecutionPolicy, typename Function, typename SerializationPolicy,
    typename... Args>
template<typename T>
void BasicFunctionMessageHandler<
    ExecutionPolicy, Function, SerializationPolicy, Args...>::
internalAddReplyValue(
    const Blob& key, const std::optional<T>& value, Response& response)
{
    if (value) {
        internalAddReplyValue(key, *value, response);
    }
}

/** \brief Function message handler with synchronous execution policy
 */
template<typename Function, typename SerializationPolicy, typename... Args>
using FunctionMessageHandler = BasicFunctionMessageHandler<
    SynchronousExecutionPolicy, Function, SerializationPolicy, Args...>;

/** \brief Wrap a function object into a message handler
 *
 * \tparam ExecutionPolicy the execution policy of the handler
 * \tparam Args the types of the arguments after the identity, which cannot
 * be deduced from a general function object
 *
 * \param function the function to be wrapped
 * \param serializer the serialization policy
 * \param keys tuple containing the keys of the arguments
 * \param replyKeys tuple containing the keys of the reply values
 *
 * \sa BasicFunctionMessageHandler
 */
template<
    typename ExecutionPolicy, typename... Args, typename Function,
    typename SerializationPolicy, typename Keys = std::tuple<>,
    typename ReplyKeys = std::tuple<>>
auto makeMessageHandler(
    Function&& function, SerializationPolicy&& serializer,
    const Keys& keys = {}, const ReplyKeys& replyKeys = {})
{
    return std::make_shared<
        BasicFunctionMessageHandler<
            ExecutionPolicy, std::decay_t<Function>,
            std::decay_t<SerializationPolicy>, Args...>>(
            std::forward<Function>(function),
            std::forward<SerializationPolicy>(serializer), keys, replyKeys);
}

/** \brief Wrap a member function call into a message handler
 *
 * \note The handler stores a reference to \p handler, which must outlive it.
 *
 * \param handler the object the member function is called on
 * \param memfn the member function executing the command
 * \param serializer the serialization policy
 * \param keys tuple containing the keys of the arguments
 * \param replyKeys tuple containing the keys of the reply values
 */
template<
    typename ExecutionPolicy = SynchronousExecutionPolicy, typename Handler,
    typename Reply, typename... Args, typename SerializationPolicy,
    typename Keys = std::tuple<>, typename ReplyKeys = std::tuple<>>
auto makeMessageHandler(
    Handler& handler, Reply (Handler::*memfn)(const Identity&, Args...),
    SerializationPolicy&& serializer, const Keys& keys = {},
    const ReplyKeys& replyKeys = {})
{
    return makeMessageHandler<ExecutionPolicy, Args...>(
        [&handler, memfn](
            const Identity& identity, std::decay_t<Args>&&... args)
        {
            return (handler.*memfn)(identity, std::move(args)...);
        },
        std::forward<SerializationPolicy>(serializer), keys, replyKeys);
}

/** \brief Wrap a member function call accepting the execution context into a
 * message handler
 *
 * \note The handler stores a reference to \p handler, which must outlive it.
 *
 * \param handler the object the member function is called on
 * \param memfn the member function executing the command, accepting the
 * execution context before the identity
 * \param serializer the serialization policy
 * \param keys tuple containing the keys of the arguments
 * \param replyKeys tuple containing the keys of the reply values
 */
template<
    typename ExecutionPolicy, typename Handler, typename Reply,
    typename ExecutionContext, typename... Args, typename SerializationPolicy,
    typename Keys = std::tuple<>, typename ReplyKeys = std::tuple<>>
auto makeMessageHandler(
    Handler& handler,
    Reply (Handler::*memfn)(ExecutionContext, const Identity&, Args...),
    SerializationPolicy&& serializer, const Keys& keys = {},
    const ReplyKeys& replyKeys = {})
{
    return makeMessageHandler<ExecutionPolicy, Args...>(
        [&handler, memfn](
            ExecutionContext context, const Identity& identity,
            std::decay_t<Args>&&... args)
        {
            return (handler.*memfn)(
                std::move(context), identity, std::move(args)...);
        },
        std::forward<SerializationPolicy>(serializer), keys, replyKeys);
}

}
}

#endif // MESSAGING_FUNCTIONMESSAGEHANDLER_HH_
