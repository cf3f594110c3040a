#pragma once

#include <stakeline/schema/validator_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(stakeline::schema,
                             validator_status_t,
                             stakeline::schema::validator_status_t::active,
                             stakeline::schema::validator_status_t::exited)

SCALE_DEFINE_ENUM_VALUE_LIST(
    stakeline::schema,
    validator_source_t,
    stakeline::schema::validator_source_t::deposit_record,
    stakeline::schema::validator_source_t::vault_request)
