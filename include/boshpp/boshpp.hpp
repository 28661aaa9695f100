#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// boshpp
// ═══════════════════════════════════════════════════════════════════════════
// Client-side BOSH (XEP-0124 / XEP-0206) session manager.
//
// For logging with spdlog, also include "boshpp/log/spdlog_logger.hpp".

#include "boshpp/bosh/bosh_body.hpp"
#include "boshpp/bosh/bosh_config.hpp"
#include "boshpp/bosh/bosh_error.hpp"
#include "boshpp/bosh/bosh_transport.hpp"
#include "boshpp/bosh/owner_mailbox.hpp"
#include "boshpp/bosh/session_state.hpp"
#include "boshpp/log/logger.hpp"
#include "boshpp/transport/http_client.hpp"
#include "boshpp/xml/stanza.hpp"
#include "boshpp/xml/xml_element.hpp"
#include "boshpp/xml/xmlns.hpp"
