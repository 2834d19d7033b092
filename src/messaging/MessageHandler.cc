#include "messaging/MessageHandler.hh"

namespace Trio {
namespace Messaging {

using namespace BlobLiterals;

const ByteSpan REPLY_SUCCESS = "OK"_BS;
const ByteSpan REPLY_FAILURE = "ERR"_BS;

Response::~Response() = default;

void Response::succeed()
{
    handleSetStatus(REPLY_SUCCESS);
}

void Response::fail()
{
    handleSetStatus(REPLY_FAILURE);
}

void Response::addParameter(const ByteSpan key, const ByteSpan value)
{
    handleAddFrame(key);
    handleAddFrame(value);
}

}
}
