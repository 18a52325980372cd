#pragma once

#include "tcpseg/address.hpp"
#include "tcpseg/checksum.hpp"
#include "tcpseg/common.hpp"
#include "tcpseg/error.hpp"
#include "tcpseg/flags.hpp"
#include "tcpseg/header.hpp"
#include "tcpseg/segment.hpp"
