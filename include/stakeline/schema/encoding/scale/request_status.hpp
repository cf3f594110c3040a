#pragma once

#include <stakeline/schema/request_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(stakeline::schema,
                             request_status_t,
                             stakeline::schema::request_status_t::pending,
                             stakeline::schema::request_status_t::processing,
                             stakeline::schema::request_status_t::claimable,
                             stakeline::schema::request_status_t::claimed,
                             stakeline::schema::request_status_t::cancelled)

SCALE_DEFINE_ENUM_VALUE_LIST(stakeline::schema,
                             request_kind_t,
                             stakeline::schema::request_kind_t::deposit,
                             stakeline::schema::request_kind_t::redeem)
