/* SPDX-License-Identifier: MPL-2.0 */

#include "utils/precompiled.hpp"
#include "protocol/response.hpp"
#include "utils/err.hpp"

namespace
{
struct response_factory_entry_t
{
    rconlink::response_type_t tag;
    rconlink::response_kind_t kind;
};

const response_factory_entry_t response_factory[] = {
  {rconlink::response_type_value, rconlink::response_command},
  {rconlink::response_type_auth, rconlink::response_auth}};

const size_t response_factory_size =
  sizeof (response_factory) / sizeof (response_factory[0]);

void init_response (rconlink::response_kind_t kind_,
                    rconlink::response_t *response_)
{
    response_->kind = kind_;
    response_->size = 0;
    response_->id = 0;
    response_->type = 0;
    response_->body.clear ();
}
}

const char *rconlink::response_kind_name (response_kind_t kind_)
{
    switch (kind_) {
        case response_terminator:
            return "terminator";
        case response_auth:
            return "auth";
        case response_command:
            return "command";
        default:
            return "unknown";
    }
}

rconlink::response_t::response_t () :
    kind (response_command), size (0), id (0), type (0)
{
}

int rconlink::make_response (response_type_t tag_, response_t *response_)
{
    rconlink_assert (response_);

    for (size_t i = 0; i < response_factory_size; ++i) {
        if (response_factory[i].tag == tag_) {
            init_response (response_factory[i].kind, response_);
            return 0;
        }
    }
    errno = EPROTO;
    return -1;
}

void rconlink::make_terminator_response (response_t *response_)
{
    rconlink_assert (response_);
    init_response (response_terminator, response_);
}
