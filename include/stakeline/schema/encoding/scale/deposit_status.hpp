#pragma once

#include <stakeline/schema/deposit_status.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(stakeline::schema,
                             deposit_status_t,
                             stakeline::schema::deposit_status_t::none,
                             stakeline::schema::deposit_status_t::requested,
                             stakeline::schema::deposit_status_t::assigned,
                             stakeline::schema::deposit_status_t::confirmed,
                             stakeline::schema::deposit_status_t::finalized,
                             stakeline::schema::deposit_status_t::cancelled)
