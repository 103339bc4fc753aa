#pragma once

#include "channel.h"
#include "webhook.h"

// Closing the queue is the sentinel that tells the delivery worker to exit.
class WebhookQueue : public Channel<WebhookEvent> {};
