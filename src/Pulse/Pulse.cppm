export module Pulse;

export import Pulse.Subscription;
export import Pulse.Threading;
export import Pulse.Events;
export import Pulse.Events.Framework;
export import Pulse.Reactive;
export import Pulse.Computed;
export import Pulse.Operators;
export import Pulse.Collections;
export import Pulse.PropertyStore;
export import Pulse.Converters;
export import Pulse.Runtime;
